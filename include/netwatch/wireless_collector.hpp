#ifndef NETWATCH_WIRELESS_COLLECTOR_HPP
#define NETWATCH_WIRELESS_COLLECTOR_HPP

#include "netwatch/collaborators.hpp"
#include "netwatch/types.hpp"
#include "netwatch/wireless_parsers.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netwatch {

enum class WirelessScanStatus { Ok, Unavailable };

struct WirelessScanResult {
    WirelessScanStatus status = WirelessScanStatus::Unavailable;
    std::vector<WirelessNetwork> networks;
    std::string source;    // back-end that produced the result
    std::string message;   // reason when unavailable

    bool available() const noexcept { return status == WirelessScanStatus::Ok; }

    const WirelessNetwork* strongest() const;
    const WirelessNetwork* findBySsid(const std::string& ssid) const;
    std::optional<int> signalStrength(const std::string& ssid) const;
    std::vector<WirelessNetwork> filterBySecurity(Security security) const;

    std::string toJson() const;
};

class WirelessBackend {
public:
    virtual ~WirelessBackend() = default;

    virtual const char* name() const = 0;
    virtual WirelessScanResult scan(std::chrono::milliseconds timeout) = 0;
};

// Runs a platform command and feeds its output to a parser.
class CommandWirelessBackend : public WirelessBackend {
public:
    CommandWirelessBackend(CommandRunner& runner, std::unique_ptr<WirelessOutputParser> parser);

    const char* name() const override { return parser_->name(); }
    WirelessScanResult scan(std::chrono::milliseconds timeout) override;

private:
    CommandRunner& runner_;
    std::unique_ptr<WirelessOutputParser> parser_;
};

class WirelessSignalCollector {
public:
    // Back-ends are tried in order; the first that is not unavailable wins.
    explicit WirelessSignalCollector(std::vector<std::unique_ptr<WirelessBackend>> backends);

    WirelessSignalCollector(const WirelessSignalCollector&) = delete;
    WirelessSignalCollector& operator=(const WirelessSignalCollector&) = delete;

    WirelessScanResult scan(std::chrono::milliseconds timeout);

    // Collapses duplicate BSSIDs (strongest kept) and sorts by signal
    // descending, then SSID.
    static void normalize(std::vector<WirelessNetwork>& networks);

private:
    std::vector<std::unique_ptr<WirelessBackend>> backends_;
};

// Native nl80211 back-end followed by the platform command back-ends.
std::vector<std::unique_ptr<WirelessBackend>> makePlatformBackends(CommandRunner& runner,
                                                                   InterfaceQuery& interfaces);

} // namespace netwatch

#endif
