#ifndef NETWATCH_CONNECTIVITY_SAMPLER_HPP
#define NETWATCH_CONNECTIVITY_SAMPLER_HPP

#include "netwatch/collaborators.hpp"
#include "netwatch/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netwatch {

struct SamplerOptions {
    std::string target = "8.8.8.8";
    std::vector<std::string> referenceHosts = {"8.8.8.8", "1.1.1.1", "208.67.222.222"};
    std::chrono::milliseconds sampleTimeout{2000};
    std::chrono::milliseconds reachabilityTimeout{1000};
    std::string dnsTestDomain = "www.google.com";

    void validate() const;
};

struct ConnectionState {
    bool connected = false;
    bool everChecked = false;
    int disconnectCount = 0;
    std::chrono::duration<double> totalDowntime{0};
    std::optional<Timestamp> lastConnected;
    std::optional<Timestamp> lastDisconnected;
};

struct HostLatency {
    std::string host;
    double roundTripMs = 0.0;
};

class ConnectivitySampler {
public:
    ConnectivitySampler(ProbeExecutor& probe, HostnameResolver& resolver,
                        SamplerOptions options = SamplerOptions());

    ConnectivitySampler(const ConnectivitySampler&) = delete;
    ConnectivitySampler& operator=(const ConnectivitySampler&) = delete;

    // One echo probe. Timeouts and unreachable hosts yield a loss sample;
    // only a malformed target raises ConfigurationError.
    LatencySample sample(const std::string& target, std::chrono::milliseconds timeout);
    LatencySample sample();

    // True when at least one reference host answers. Updates the
    // connection state and logs lost/restored transitions.
    bool checkInternetReachable();

    // Reference host with the lowest round trip, if any answered.
    std::optional<HostLatency> findFastestHost();

    // Forward lookup time in milliseconds, absent when resolution fails.
    std::optional<double> measureDnsResolution(const std::string& domain);
    std::optional<double> measureDnsResolution();

    ConnectionState connectionState() const;
    const SamplerOptions& options() const noexcept { return options_; }

private:
    std::optional<double> probe_host(const Ipv4Address& address, std::chrono::milliseconds timeout);
    std::vector<std::optional<double>> probe_references();
    void update_state(bool reachable);

    ProbeExecutor& probe_;
    HostnameResolver& resolver_;
    SamplerOptions options_;
    std::vector<Ipv4Address> references_;

    std::atomic<uint64_t> next_sequence_{1};
    std::atomic<bool> icmp_unavailable_{false};

    mutable std::mutex state_mutex_;
    ConnectionState state_;
};

} // namespace netwatch

#endif
