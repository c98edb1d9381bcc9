#ifndef NETWATCH_TYPES_HPP
#define NETWATCH_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netwatch {

using Timestamp = std::chrono::system_clock::time_point;

// IPv4 address held in host byte order so that comparison is numeric.
class Ipv4Address {
public:
    Ipv4Address() = default;
    explicit Ipv4Address(uint32_t value) : value_(value) {}

    static std::optional<Ipv4Address> parse(const std::string& text);

    uint32_t value() const noexcept { return value_; }
    std::string toString() const;

    bool operator==(const Ipv4Address& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const Ipv4Address& other) const noexcept { return value_ != other.value_; }
    bool operator<(const Ipv4Address& other) const noexcept { return value_ < other.value_; }

private:
    uint32_t value_ = 0;
};

struct Device {
    Ipv4Address address;
    std::optional<std::string> physicalAddress;
    std::optional<std::string> hostname;
    bool reachable = false;
    Timestamp lastSeen;

    std::string toJson() const;
};

enum class Security { Open, WEP, WPA, WPA2, WPA3, Unknown };

const char* toString(Security security);

struct WirelessNetwork {
    std::string ssid;
    std::string bssid;
    int signalPercent = 0;
    int channel = 0;
    Security security = Security::Unknown;
    std::optional<int> rssiDbm;
    std::optional<uint32_t> frequencyMhz;

    std::string toJson() const;
};

struct LatencySample {
    Timestamp timestamp;
    std::optional<double> roundTripMs;   // absent = loss
    uint64_t sequence = 0;

    bool lost() const noexcept { return !roundTripMs; }
};

enum class HealthCategory { Excellent, Good, Fair, Poor };

const char* toString(HealthCategory category);

struct HealthSnapshot {
    Timestamp timestamp;
    int score = 0;
    HealthCategory category = HealthCategory::Poor;
    std::optional<double> latencyMs;      // mean over the batch
    // The single sample taken since the previous snapshot, if any; an
    // absent round trip with `sampled` set is a lost probe.
    bool sampled = false;
    std::optional<double> sampleRoundTripMs;
    double packetLossPercent = 100.0;
    double jitterMs = 0.0;
    double uptimePercent = 0.0;
    int successfulSamples = 0;
    int attemptedSamples = 0;
    std::vector<std::string> alerts;

    std::string toJson() const;
};

// Signal strength helpers shared by the wireless parsers.
int percentFromDbm(int dbm);
int dbmFromPercent(int percent);
int channelFromFrequency(uint32_t frequencyMhz);

std::string formatTimestamp(const Timestamp& timestamp);
std::string escapeJson(const std::string& text);

} // namespace netwatch

#endif
