#ifndef NETWATCH_CONFIG_HPP
#define NETWATCH_CONFIG_HPP

#include "netwatch/connectivity_sampler.hpp"
#include "netwatch/device_discovery.hpp"
#include "netwatch/health_policy.hpp"
#include "netwatch/log.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace netwatch {

struct WirelessOptions {
    std::chrono::milliseconds scanTimeout{10000};

    void validate() const;
};

struct MonitorConfig {
    DiscoveryOptions discovery;
    SamplerOptions sampler;
    HealthPolicy policy;
    WirelessOptions wireless;
    LogLevel logLevel = LogLevel::Info;

    // Validates every section; throws ConfigurationError on the first
    // invalid value.
    void validate() const;
};

enum class Command { Devices, Wifi, Health, Diagnose };
enum class OutputFormat { Json, Table };

const char* toString(Command command);

struct CommandLine {
    MonitorConfig config;
    Command command = Command::Devices;
    OutputFormat format = OutputFormat::Json;
    std::optional<std::string> range;
    std::chrono::seconds interval{5};
    int count = 1;                        // health snapshots to take
    std::optional<size_t> historyLimit;
    bool showHelp = false;
};

// Applies NETWATCH_LOG_LEVEL, if set, to `config`. An unknown level name is
// a ConfigurationError.
void applyEnvironment(MonitorConfig& config);

// Parses argv into a validated command line. Throws ConfigurationError for
// unknown options, missing or malformed values.
CommandLine parseArguments(int argc, char* argv[]);

} // namespace netwatch

#endif
