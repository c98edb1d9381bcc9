#include "netwatch/config.hpp"

#include "netwatch/address_space.hpp"
#include "netwatch/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace netwatch {

namespace {

const char* kLogLevelVariable = "NETWATCH_LOG_LEVEL";

long parse_positive(const std::string& option, const std::string& text) {
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno == ERANGE || value <= 0 ||
        value > std::numeric_limits<int>::max()) {
        throw ConfigurationError(option + " expects a positive integer, got '" + text + "'");
    }
    return value;
}

bool parse_command(const std::string& text, Command& command) {
    if (text == "devices") {
        command = Command::Devices;
    } else if (text == "wifi") {
        command = Command::Wifi;
    } else if (text == "health") {
        command = Command::Health;
    } else if (text == "diagnose") {
        command = Command::Diagnose;
    } else {
        return false;
    }
    return true;
}

} // namespace

const char* toString(Command command) {
    switch (command) {
        case Command::Devices: return "devices";
        case Command::Wifi: return "wifi";
        case Command::Health: return "health";
        case Command::Diagnose: return "diagnose";
    }
    return "unknown";
}

void WirelessOptions::validate() const {
    if (scanTimeout.count() <= 0) {
        throw ConfigurationError("wireless scan timeout must be positive");
    }
}

void MonitorConfig::validate() const {
    discovery.validate();
    sampler.validate();
    policy.validate();
    wireless.validate();
}

void applyEnvironment(MonitorConfig& config) {
    const char* value = std::getenv(kLogLevelVariable);
    if (value == nullptr || *value == '\0') {
        return;
    }
    if (!parseLogLevel(value, config.logLevel)) {
        throw ConfigurationError(std::string(kLogLevelVariable) + " has unknown level '" + value + "'");
    }
}

CommandLine parseArguments(int argc, char* argv[]) {
    CommandLine cli;
    applyEnvironment(cli.config);

    bool command_seen = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigurationError("option " + arg + " requires a value");
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            cli.showHelp = true;
        } else if (arg == "-j" || arg == "--json") {
            cli.format = OutputFormat::Json;
        } else if (arg == "-t" || arg == "--table") {
            cli.format = OutputFormat::Table;
        } else if (arg == "-r" || arg == "--range") {
            std::string text = value();
            if (!Cidr::tryParse(text)) {
                throw ConfigurationError("invalid network range '" + text + "'");
            }
            cli.range = text;
        } else if (arg == "-s" || arg == "--strategy") {
            std::string text = value();
            if (!parseStrategy(text, cli.config.discovery.strategy)) {
                throw ConfigurationError("unknown strategy '" + text + "' (expected auto, arp or ping)");
            }
        } else if (arg == "--max-addresses") {
            cli.config.discovery.maxAddresses = static_cast<size_t>(parse_positive(arg, value()));
        } else if (arg == "--concurrency") {
            cli.config.discovery.concurrency = static_cast<int>(parse_positive(arg, value()));
        } else if (arg == "--timeout-ms") {
            std::chrono::milliseconds timeout(parse_positive(arg, value()));
            cli.config.discovery.probeTimeout = timeout;
            cli.config.sampler.sampleTimeout = timeout;
        } else if (arg == "--sweep-timeout") {
            cli.config.discovery.sweepTimeout = std::chrono::seconds(parse_positive(arg, value()));
        } else if (arg == "--no-resolve") {
            cli.config.discovery.resolveHostnames = false;
        } else if (arg == "--target") {
            cli.config.sampler.target = value();
        } else if (arg == "--interval") {
            cli.interval = std::chrono::seconds(parse_positive(arg, value()));
        } else if (arg == "--count") {
            cli.count = static_cast<int>(parse_positive(arg, value()));
        } else if (arg == "--history") {
            cli.historyLimit = static_cast<size_t>(parse_positive(arg, value()));
        } else if (arg == "-v" || arg == "--verbose") {
            cli.config.logLevel = LogLevel::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            cli.config.logLevel = LogLevel::Error;
        } else if (!arg.empty() && arg[0] != '-' && !command_seen) {
            if (!parse_command(arg, cli.command)) {
                throw ConfigurationError("unknown command '" + arg + "'");
            }
            command_seen = true;
        } else {
            throw ConfigurationError("unknown option: " + arg);
        }
    }

    if (!cli.showHelp) {
        cli.config.validate();
    }
    return cli;
}

} // namespace netwatch
