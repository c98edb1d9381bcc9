#include "netwatch/wireless_collector.hpp"

#include "netwatch/log.hpp"
#include "netwatch/nl80211_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <memory>
#include <sstream>

namespace netwatch {

namespace {

std::string normalized_bssid(const std::string& bssid) {
    std::string key(bssid);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '-' ? ':' : static_cast<char>(std::tolower(c));
    });
    return key;
}

} // namespace

const WirelessNetwork* WirelessScanResult::strongest() const {
    auto it = std::max_element(networks.begin(), networks.end(),
        [](const WirelessNetwork& a, const WirelessNetwork& b) {
            return a.signalPercent < b.signalPercent;
        });
    return it == networks.end() ? nullptr : &*it;
}

const WirelessNetwork* WirelessScanResult::findBySsid(const std::string& ssid) const {
    // Networks are sorted strongest first, so the first match is the best BSS.
    for (const auto& network : networks) {
        if (network.ssid == ssid) {
            return &network;
        }
    }
    return nullptr;
}

std::optional<int> WirelessScanResult::signalStrength(const std::string& ssid) const {
    const WirelessNetwork* network = findBySsid(ssid);
    if (!network) {
        return std::nullopt;
    }
    return network->rssiDbm ? *network->rssiDbm : dbmFromPercent(network->signalPercent);
}

std::vector<WirelessNetwork> WirelessScanResult::filterBySecurity(Security security) const {
    std::vector<WirelessNetwork> result;
    std::copy_if(networks.begin(), networks.end(), std::back_inserter(result),
                 [security](const WirelessNetwork& n) { return n.security == security; });
    return result;
}

std::string WirelessScanResult::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"status\":\"" << (available() ? "ok" : "unavailable") << "\",";
    json << "\"source\":\"" << escapeJson(source) << "\",";
    if (!message.empty()) {
        json << "\"message\":\"" << escapeJson(message) << "\",";
    }
    json << "\"networks\":[";
    for (size_t i = 0; i < networks.size(); ++i) {
        if (i > 0) json << ",";
        json << networks[i].toJson();
    }
    json << "]}";
    return json.str();
}

CommandWirelessBackend::CommandWirelessBackend(CommandRunner& runner,
                                               std::unique_ptr<WirelessOutputParser> parser)
    : runner_(runner)
    , parser_(std::move(parser))
{
}

WirelessScanResult CommandWirelessBackend::scan(std::chrono::milliseconds timeout) {
    WirelessScanResult result;
    result.source = parser_->name();

    CommandResult command = runner_.run(parser_->command(), timeout);
    if (!command.launched) {
        result.message = std::string(parser_->name()) + " not found";
        return result;
    }
    if (command.timedOut && command.output.empty()) {
        result.message = std::string(parser_->name()) + " timed out";
        return result;
    }

    result.networks = parser_->parse(command.output);
    if (command.exitCode != 0 && result.networks.empty()) {
        std::ostringstream oss;
        oss << parser_->name() << " exited with status " << command.exitCode;
        result.message = oss.str();
        return result;
    }

    result.status = WirelessScanStatus::Ok;
    return result;
}

WirelessSignalCollector::WirelessSignalCollector(std::vector<std::unique_ptr<WirelessBackend>> backends)
    : backends_(std::move(backends))
{
}

void WirelessSignalCollector::normalize(std::vector<WirelessNetwork>& networks) {
    std::sort(networks.begin(), networks.end(),
        [](const WirelessNetwork& a, const WirelessNetwork& b) {
            std::string ka = normalized_bssid(a.bssid);
            std::string kb = normalized_bssid(b.bssid);
            if (ka != kb) return ka < kb;
            return a.signalPercent > b.signalPercent;
        });
    auto last = std::unique(networks.begin(), networks.end(),
        [](const WirelessNetwork& a, const WirelessNetwork& b) {
            return normalized_bssid(a.bssid) == normalized_bssid(b.bssid);
        });
    networks.erase(last, networks.end());

    std::sort(networks.begin(), networks.end(),
        [](const WirelessNetwork& a, const WirelessNetwork& b) {
            if (a.signalPercent != b.signalPercent) return a.signalPercent > b.signalPercent;
            if (a.ssid != b.ssid) return a.ssid < b.ssid;
            return a.bssid < b.bssid;
        });
}

WirelessScanResult WirelessSignalCollector::scan(std::chrono::milliseconds timeout) {
    std::string reasons;

    for (auto& backend : backends_) {
        NETWATCH_LOG_DEBUG("wireless", "trying back-end " << backend->name());
        WirelessScanResult result = backend->scan(timeout);
        if (result.available()) {
            normalize(result.networks);
            NETWATCH_LOG_INFO("wireless", "scan via " << result.source << ": "
                              << result.networks.size() << " networks");
            return result;
        }
        NETWATCH_LOG_DEBUG("wireless", backend->name() << " unavailable: " << result.message);
        if (!reasons.empty()) reasons += "; ";
        reasons += result.message;
    }

    WirelessScanResult unavailable;
    unavailable.message = reasons.empty() ? "no wireless back-end configured" : reasons;
    NETWATCH_LOG_ERROR("wireless", "wireless scanning unavailable: " << unavailable.message);
    return unavailable;
}

std::vector<std::unique_ptr<WirelessBackend>> makePlatformBackends(CommandRunner& runner,
                                                                   InterfaceQuery& interfaces) {
    std::vector<std::unique_ptr<WirelessBackend>> backends;
    backends.push_back(std::make_unique<Nl80211Backend>(interfaces));
    for (auto& parser : makePlatformParsers()) {
        backends.push_back(std::make_unique<CommandWirelessBackend>(runner, std::move(parser)));
    }
    return backends;
}

} // namespace netwatch
