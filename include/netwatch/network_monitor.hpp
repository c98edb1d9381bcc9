#ifndef NETWATCH_NETWORK_MONITOR_HPP
#define NETWATCH_NETWORK_MONITOR_HPP

#include "netwatch/address_space.hpp"
#include "netwatch/collaborators.hpp"
#include "netwatch/config.hpp"
#include "netwatch/connectivity_sampler.hpp"
#include "netwatch/device_discovery.hpp"
#include "netwatch/health_engine.hpp"
#include "netwatch/wireless_collector.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netwatch {

struct DiagnosisReport {
    bool internetReachable = false;
    HealthSnapshot health;
    std::optional<double> dnsResolutionMs;
    StabilityReport stability;
    std::optional<HostLatency> fastestHost;
    std::vector<std::string> recommendations;

    std::string toJson() const;
};

struct SystemCollaborators;

// Entry point for front ends: owns the engines and wires them to the
// probe, resolver, interface and command collaborators.
class NetworkMonitor {
public:
    // Uses the Linux system collaborators.
    explicit NetworkMonitor(MonitorConfig config = MonitorConfig());

    // Uses caller-owned collaborators, which must outlive the monitor.
    NetworkMonitor(ProbeExecutor& probe, HostnameResolver& resolver, InterfaceQuery& interfaces,
                   std::vector<std::unique_ptr<WirelessBackend>> backends,
                   MonitorConfig config = MonitorConfig());

    ~NetworkMonitor();

    NetworkMonitor(const NetworkMonitor&) = delete;
    NetworkMonitor& operator=(const NetworkMonitor&) = delete;

    DiscoveryResult discoverDevices(const std::optional<std::string>& range = std::nullopt,
                                    std::optional<DiscoveryStrategy> strategy = std::nullopt);
    void cancelDiscovery();

    // Devices found by the most recent sweep.
    std::optional<DiscoveryResult> lastDiscovery() const;
    std::optional<Device> findDevice(const Ipv4Address& address) const;

    WirelessScanResult scanWirelessNetworks();

    void startHealthMonitoring(std::chrono::seconds interval);
    void stopHealthMonitoring();
    bool isMonitoring() const;

    // Latest snapshot, or a fresh one when nothing has been sampled yet.
    HealthSnapshot getCurrentHealth();
    std::vector<HealthSnapshot> getHealthHistory(std::optional<size_t> limit = std::nullopt) const;
    HealthStatistics getHealthStatistics(std::optional<size_t> windowSize = std::nullopt) const;

    DiagnosisReport diagnose();

    const MonitorConfig& config() const noexcept { return config_; }
    ConnectivitySampler& sampler() noexcept { return sampler_; }
    HealthScoringEngine& health() noexcept { return health_; }

private:
    NetworkMonitor(std::unique_ptr<SystemCollaborators> system, MonitorConfig config);

    std::unique_ptr<SystemCollaborators> system_;
    MonitorConfig config_;

    AddressSpaceEnumerator enumerator_;
    DeviceDiscoveryEngine discovery_;
    ConnectivitySampler sampler_;
    HealthScoringEngine health_;
    WirelessSignalCollector wireless_;

    mutable std::mutex discovery_mutex_;
    std::optional<DiscoveryResult> last_discovery_;
};

} // namespace netwatch

#endif
