#ifndef NETWATCH_DEVICE_DISCOVERY_HPP
#define NETWATCH_DEVICE_DISCOVERY_HPP

#include "netwatch/address_space.hpp"
#include "netwatch/collaborators.hpp"
#include "netwatch/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace netwatch {

enum class DiscoveryStrategy { Auto, ArpOnly, PingOnly };

const char* toString(DiscoveryStrategy strategy);
bool parseStrategy(const std::string& text, DiscoveryStrategy& strategy);

struct DiscoveryOptions {
    DiscoveryStrategy strategy = DiscoveryStrategy::Auto;
    size_t maxAddresses = 254;
    int concurrency = 30;
    std::chrono::milliseconds probeTimeout{1000};
    std::chrono::milliseconds resolveTimeout{500};
    std::chrono::milliseconds sweepTimeout{60000};
    bool resolveHostnames = true;

    // Throws ConfigurationError for non-positive limits or timeouts.
    void validate() const;
};

struct DiscoverySummary {
    Cidr range;
    size_t addressesProbed = 0;
    size_t respondCount = 0;
    DiscoveryStrategy strategyUsed = DiscoveryStrategy::Auto;
    std::chrono::milliseconds elapsed{0};
    bool truncated = false;
    bool timedOut = false;
    bool cancelled = false;
    // The requested probe method could not run at all (e.g. ARP without
    // raw-socket privilege and no fallback allowed).
    bool capabilityUnavailable = false;

    std::string toJson() const;
};

struct DiscoveryResult {
    std::vector<Device> devices;   // ascending by numeric address
    DiscoverySummary summary;

    const Device* findDevice(const Ipv4Address& address) const;
    size_t deviceCount() const noexcept { return devices.size(); }
};

// Preferred/Fallback selector, decided once per sweep and never re-evaluated
// per address.
class StrategySelector {
public:
    enum class State { Preferred, Fallback };

    explicit StrategySelector(DiscoveryStrategy requested);

    State state() const noexcept { return state_; }
    ProbeMethod method() const noexcept;
    bool canFallBack() const noexcept;
    void fallBack();
    DiscoveryStrategy effectiveStrategy() const noexcept;

private:
    DiscoveryStrategy requested_;
    State state_ = State::Preferred;
};

class DeviceDiscoveryEngine {
public:
    DeviceDiscoveryEngine(ProbeExecutor& probe, HostnameResolver& resolver);

    DeviceDiscoveryEngine(const DeviceDiscoveryEngine&) = delete;
    DeviceDiscoveryEngine& operator=(const DeviceDiscoveryEngine&) = delete;

    // Blocks until the sweep completes, is cancelled, or the sweep timeout
    // elapses. Never throws for probe failures; an empty device list is a
    // valid result.
    //
    // Probes and lookups already in flight at the deadline are allowed to
    // finish, so the call can return up to probeTimeout + resolveTimeout
    // after sweepTimeout (probeTimeout + 1 s when ICMP goes through the
    // ping command). No new lookup starts once the deadline has passed.
    DiscoveryResult discover(const Cidr& range, const DiscoveryOptions& options);

    // Requests cooperative cancellation of the sweep in progress. A sweep is
    // in progress from the moment discover() has validated its options until
    // it returns; a cancel() outside that window has no effect and does not
    // carry over to the next sweep.
    void cancel();

private:
    ProbeExecutor& probe_;
    HostnameResolver& resolver_;

    std::mutex active_mutex_;
    std::shared_ptr<std::atomic<bool>> active_cancel_;
};

} // namespace netwatch

#endif
