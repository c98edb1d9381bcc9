#include "netwatch/network_monitor.hpp"

#include "netwatch/log.hpp"
#include "netwatch/system.hpp"

#include <iomanip>
#include <sstream>

namespace netwatch {

struct SystemCollaborators {
    SystemCollaborators() : probe(runner) {}

    SystemCommandRunner runner;
    SystemProbeExecutor probe;
    SystemHostnameResolver resolver;
    SystemInterfaceQuery interfaces;
};

namespace {

MonitorConfig validated(MonitorConfig config) {
    config.validate();
    return config;
}

} // namespace

std::string DiagnosisReport::toJson() const {
    std::ostringstream json;
    json << std::fixed << std::setprecision(2);
    json << "{";
    json << "\"internet_connected\":" << (internetReachable ? "true" : "false") << ",";
    json << "\"health\":" << health.toJson() << ",";
    json << "\"dns_resolution_ms\":";
    if (dnsResolutionMs) {
        json << *dnsResolutionMs;
    } else {
        json << "null";
    }
    json << ",\"stability\":" << stability.toJson() << ",";
    json << "\"optimal_host\":";
    if (fastestHost) {
        json << "{\"host\":\"" << escapeJson(fastestHost->host) << "\","
             << "\"latency_ms\":" << fastestHost->roundTripMs << "}";
    } else {
        json << "null";
    }
    json << ",\"recommendations\":[";
    for (size_t i = 0; i < recommendations.size(); ++i) {
        if (i > 0) json << ",";
        json << "\"" << escapeJson(recommendations[i]) << "\"";
    }
    json << "]}";
    return json.str();
}

NetworkMonitor::NetworkMonitor(MonitorConfig config)
    : NetworkMonitor(std::make_unique<SystemCollaborators>(), std::move(config))
{
}

NetworkMonitor::NetworkMonitor(std::unique_ptr<SystemCollaborators> system, MonitorConfig config)
    : system_(std::move(system))
    , config_(validated(std::move(config)))
    , enumerator_(system_->interfaces)
    , discovery_(system_->probe, system_->resolver)
    , sampler_(system_->probe, system_->resolver, config_.sampler)
    , health_(sampler_, config_.policy)
    , wireless_(makePlatformBackends(system_->runner, system_->interfaces))
{
}

NetworkMonitor::NetworkMonitor(ProbeExecutor& probe, HostnameResolver& resolver,
                               InterfaceQuery& interfaces,
                               std::vector<std::unique_ptr<WirelessBackend>> backends,
                               MonitorConfig config)
    : config_(validated(std::move(config)))
    , enumerator_(interfaces)
    , discovery_(probe, resolver)
    , sampler_(probe, resolver, config_.sampler)
    , health_(sampler_, config_.policy)
    , wireless_(std::move(backends))
{
}

NetworkMonitor::~NetworkMonitor() {
    health_.stop();
}

DiscoveryResult NetworkMonitor::discoverDevices(const std::optional<std::string>& range,
                                                std::optional<DiscoveryStrategy> strategy) {
    Cidr cidr = enumerator_.resolveRange(range);

    DiscoveryOptions options = config_.discovery;
    if (strategy) {
        options.strategy = *strategy;
    }

    DiscoveryResult result = discovery_.discover(cidr, options);

    std::lock_guard<std::mutex> lock(discovery_mutex_);
    last_discovery_ = result;
    return result;
}

void NetworkMonitor::cancelDiscovery() {
    discovery_.cancel();
}

std::optional<DiscoveryResult> NetworkMonitor::lastDiscovery() const {
    std::lock_guard<std::mutex> lock(discovery_mutex_);
    return last_discovery_;
}

std::optional<Device> NetworkMonitor::findDevice(const Ipv4Address& address) const {
    std::lock_guard<std::mutex> lock(discovery_mutex_);
    if (!last_discovery_) {
        return std::nullopt;
    }
    const Device* device = last_discovery_->findDevice(address);
    if (!device) {
        return std::nullopt;
    }
    return *device;
}

WirelessScanResult NetworkMonitor::scanWirelessNetworks() {
    return wireless_.scan(config_.wireless.scanTimeout);
}

void NetworkMonitor::startHealthMonitoring(std::chrono::seconds interval) {
    health_.start(interval);
}

void NetworkMonitor::stopHealthMonitoring() {
    health_.stop();
}

bool NetworkMonitor::isMonitoring() const {
    return health_.state() == MonitorState::Sampling;
}

HealthSnapshot NetworkMonitor::getCurrentHealth() {
    std::optional<HealthSnapshot> latest = health_.latest();
    if (latest) {
        return *latest;
    }
    return health_.sampleOnce();
}

std::vector<HealthSnapshot> NetworkMonitor::getHealthHistory(std::optional<size_t> limit) const {
    return health_.getHistory(limit);
}

HealthStatistics NetworkMonitor::getHealthStatistics(std::optional<size_t> windowSize) const {
    return health_.getStatistics(windowSize);
}

DiagnosisReport NetworkMonitor::diagnose() {
    NETWATCH_LOG_INFO("diagnose", "running connection diagnosis");

    DiagnosisReport report;
    report.health = health_.sampleOnce();
    report.internetReachable = sampler_.connectionState().connected;
    if (report.internetReachable) {
        report.dnsResolutionMs = sampler_.measureDnsResolution();
        report.fastestHost = sampler_.findFastestHost();
    }
    report.stability = health_.stability();

    const AlertThresholds& limits = config_.policy.thresholds;
    std::vector<std::string>& out = report.recommendations;
    if (!report.internetReachable) {
        out.push_back("CRITICAL: no internet connection");
        out.push_back("  - check network cables");
        out.push_back("  - restart the router");
        out.push_back("  - check network settings");
    } else {
        if (report.health.latencyMs && *report.health.latencyMs > limits.latencyWarningMs) {
            out.push_back("High latency detected");
            out.push_back("  - check for downloads or uploads in progress");
            out.push_back("  - test again at a different time");
        }
        if (report.health.packetLossPercent > limits.lossWarningPercent) {
            out.push_back("Significant packet loss");
            out.push_back("  - check cables and connections");
            out.push_back("  - try a wired connection instead of Wi-Fi");
        }
        if (report.health.jitterMs > limits.jitterWarningMs) {
            out.push_back("High latency variation (jitter)");
            out.push_back("  - reduce the number of connected devices");
            out.push_back("  - prioritise traffic with QoS on the router");
        }
        if (report.dnsResolutionMs && *report.dnsResolutionMs > 100) {
            out.push_back("Slow DNS resolution");
            out.push_back("  - consider a public resolver (8.8.8.8, 1.1.1.1)");
        }
        if (report.stability.disconnectEvents > 5) {
            out.push_back("Repeated disconnections detected");
            out.push_back("  - check the provider's stability");
            out.push_back("  - update the router firmware");
        }
    }
    if (out.empty()) {
        out.push_back("Connection is healthy, no problems detected");
    }
    return report;
}

} // namespace netwatch
