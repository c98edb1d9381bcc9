#include "netwatch/device_discovery.hpp"

#include "netwatch/errors.hpp"
#include "netwatch/log.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <exception>
#include <optional>
#include <sstream>
#include <thread>

namespace netwatch {

const char* toString(DiscoveryStrategy strategy) {
    switch (strategy) {
        case DiscoveryStrategy::Auto: return "auto";
        case DiscoveryStrategy::ArpOnly: return "arp";
        case DiscoveryStrategy::PingOnly: return "ping";
    }
    return "auto";
}

bool parseStrategy(const std::string& text, DiscoveryStrategy& strategy) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "auto") {
        strategy = DiscoveryStrategy::Auto;
    } else if (lower == "arp" || lower == "arp-only") {
        strategy = DiscoveryStrategy::ArpOnly;
    } else if (lower == "ping" || lower == "ping-only") {
        strategy = DiscoveryStrategy::PingOnly;
    } else {
        return false;
    }
    return true;
}

void DiscoveryOptions::validate() const {
    if (maxAddresses == 0) {
        throw ConfigurationError("maxAddresses must be positive");
    }
    if (concurrency <= 0) {
        throw ConfigurationError("concurrency must be positive");
    }
    if (probeTimeout.count() <= 0) {
        throw ConfigurationError("probe timeout must be positive");
    }
    if (resolveTimeout.count() <= 0) {
        throw ConfigurationError("resolve timeout must be positive");
    }
    if (sweepTimeout.count() <= 0) {
        throw ConfigurationError("sweep timeout must be positive");
    }
}

std::string DiscoverySummary::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"range\":\"" << range.toString() << "\",";
    json << "\"addresses_probed\":" << addressesProbed << ",";
    json << "\"respond_count\":" << respondCount << ",";
    json << "\"strategy_used\":\"" << toString(strategyUsed) << "\",";
    json << "\"elapsed_ms\":" << elapsed.count() << ",";
    json << "\"truncated\":" << (truncated ? "true" : "false") << ",";
    json << "\"timed_out\":" << (timedOut ? "true" : "false") << ",";
    json << "\"cancelled\":" << (cancelled ? "true" : "false") << ",";
    json << "\"capability_unavailable\":" << (capabilityUnavailable ? "true" : "false");
    json << "}";
    return json.str();
}

const Device* DiscoveryResult::findDevice(const Ipv4Address& address) const {
    auto it = std::lower_bound(devices.begin(), devices.end(), address,
        [](const Device& device, const Ipv4Address& value) {
            return device.address < value;
        });
    if (it != devices.end() && it->address == address) {
        return &*it;
    }
    return nullptr;
}

StrategySelector::StrategySelector(DiscoveryStrategy requested)
    : requested_(requested)
{
}

ProbeMethod StrategySelector::method() const noexcept {
    if (requested_ == DiscoveryStrategy::PingOnly || state_ == State::Fallback) {
        return ProbeMethod::IcmpEcho;
    }
    return ProbeMethod::Arp;
}

bool StrategySelector::canFallBack() const noexcept {
    return requested_ == DiscoveryStrategy::Auto && state_ == State::Preferred;
}

void StrategySelector::fallBack() {
    if (canFallBack()) {
        state_ = State::Fallback;
    }
}

DiscoveryStrategy StrategySelector::effectiveStrategy() const noexcept {
    return method() == ProbeMethod::Arp ? DiscoveryStrategy::ArpOnly
                                        : DiscoveryStrategy::PingOnly;
}

namespace {

using Clock = std::chrono::steady_clock;

// Owns the workers and the aggregation buffer of exactly one sweep.
class ScanSession {
public:
    ScanSession(ProbeExecutor& probe, HostnameResolver& resolver,
                const DiscoveryOptions& options, std::vector<Ipv4Address> addresses,
                std::shared_ptr<std::atomic<bool>> cancel)
        : probe_(probe)
        , resolver_(resolver)
        , options_(options)
        , addresses_(std::move(addresses))
        , cancel_(std::move(cancel))
        , slots_(addresses_.size())
        , deadline_(Clock::now() + options.sweepTimeout)
    {
    }

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    ~ScanSession() {
        stop_.store(true);
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    DiscoverySummary run(DiscoverySummary summary, std::vector<Device>& devices);

private:
    ProbeResult probe_one(const Ipv4Address& address, ProbeMethod method);
    void handle_result(size_t index, const ProbeResult& result);
    void worker_loop(size_t first, size_t stride, ProbeMethod method);
    bool should_stop() const {
        return stop_.load() || cancel_->load() || Clock::now() >= deadline_;
    }

    ProbeExecutor& probe_;
    HostnameResolver& resolver_;
    const DiscoveryOptions& options_;
    std::vector<Ipv4Address> addresses_;
    std::shared_ptr<std::atomic<bool>> cancel_;

    std::mutex mutex_;
    std::condition_variable done_cv_;
    std::vector<std::optional<Device>> slots_;   // one per candidate address
    size_t probed_ = 0;
    size_t finished_workers_ = 0;
    bool closed_ = false;

    std::atomic<bool> stop_{false};
    std::vector<std::thread> workers_;
    Clock::time_point deadline_;
};

ProbeResult ScanSession::probe_one(const Ipv4Address& address, ProbeMethod method) {
    try {
        return probe_.probe(address, method, options_.probeTimeout);
    } catch (const std::exception& e) {
        NETWATCH_LOG_DEBUG("discovery", "probe of " << address.toString()
                           << " failed: " << e.what());
        ProbeResult failed;
        failed.status = ProbeStatus::Error;
        return failed;
    }
}

void ScanSession::handle_result(size_t index, const ProbeResult& result) {
    std::optional<Device> device;
    if (result.reachable()) {
        Device found;
        found.address = addresses_[index];
        found.reachable = true;
        found.physicalAddress = result.physicalAddress;
        found.lastSeen = std::chrono::system_clock::now();

        if (options_.resolveHostnames && !should_stop()) {
            found.hostname = resolver_.reverseLookup(found.address, options_.resolveTimeout);
        }
        NETWATCH_LOG_DEBUG("discovery", "device found: " << found.address.toString()
                           << (found.hostname ? " (" + *found.hostname + ")" : std::string()));
        device = std::move(found);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;   // sweep already published; late results are discarded
    }
    ++probed_;
    slots_[index] = std::move(device);
}

void ScanSession::worker_loop(size_t first, size_t stride, ProbeMethod method) {
    for (size_t i = first; i < addresses_.size(); i += stride) {
        if (should_stop()) {
            break;
        }
        handle_result(i, probe_one(addresses_[i], method));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++finished_workers_;
    done_cv_.notify_all();
}

DiscoverySummary ScanSession::run(DiscoverySummary summary, std::vector<Device>& devices) {
    StrategySelector selector(options_.strategy);

    // The first address doubles as the capability check for the whole sweep.
    ProbeResult first = probe_one(addresses_[0], selector.method());
    if (first.status == ProbeStatus::Unavailable && selector.canFallBack()) {
        NETWATCH_LOG_WARN("discovery", toString(selector.method())
                          << " probing unavailable (insufficient privilege?), falling back to ping for this sweep");
        selector.fallBack();
        first = probe_one(addresses_[0], selector.method());
    }
    summary.strategyUsed = selector.effectiveStrategy();

    if (first.status == ProbeStatus::Unavailable) {
        NETWATCH_LOG_ERROR("discovery", toString(selector.method())
                           << " probing unavailable, sweep aborted; try elevated privileges or --strategy ping");
        summary.capabilityUnavailable = true;
        summary.addressesProbed = 1;
        return summary;
    }
    handle_result(0, first);

    size_t remaining = addresses_.size() - 1;
    size_t worker_count = std::min(static_cast<size_t>(options_.concurrency), remaining);
    ProbeMethod method = selector.method();

    // Static partition: worker w takes indices 1+w, 1+w+k, 1+w+2k, ...
    for (size_t w = 0; w < worker_count; ++w) {
        workers_.emplace_back(&ScanSession::worker_loop, this, 1 + w, worker_count, method);
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool completed = done_cv_.wait_until(lock, deadline_, [&] {
            return finished_workers_ == worker_count;
        });

        if (!completed) {
            summary.timedOut = true;
            NETWATCH_LOG_WARN("discovery", "sweep timeout of " << options_.sweepTimeout.count()
                              << " ms reached, returning partial results");
        }
        if (cancel_->load()) {
            summary.cancelled = true;
        }

        closed_ = true;
        summary.addressesProbed = probed_;
        for (auto& slot : slots_) {
            if (slot) {
                devices.push_back(*slot);
            }
        }
    }

    stop_.store(true);
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
    return summary;
}

} // namespace

DeviceDiscoveryEngine::DeviceDiscoveryEngine(ProbeExecutor& probe, HostnameResolver& resolver)
    : probe_(probe)
    , resolver_(resolver)
{
}

void DeviceDiscoveryEngine::cancel() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (active_cancel_) {
        active_cancel_->store(true);
    }
}

DiscoveryResult DeviceDiscoveryEngine::discover(const Cidr& range, const DiscoveryOptions& options) {
    options.validate();

    auto started = Clock::now();
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_cancel_ = cancel;
    }

    DiscoveryResult result;
    result.summary.range = range;
    result.summary.strategyUsed = options.strategy;

    std::vector<Ipv4Address> addresses = range.hosts(options.maxAddresses);
    if (range.hostCount() > options.maxAddresses) {
        result.summary.truncated = true;
        NETWATCH_LOG_WARN("discovery", "range " << range.toString() << " has "
                          << range.hostCount() << " hosts, probing only the first "
                          << options.maxAddresses);
    }

    NETWATCH_LOG_INFO("discovery", "scanning " << addresses.size() << " addresses in "
                      << range.toString() << " (strategy " << toString(options.strategy)
                      << ", concurrency " << options.concurrency << ")");

    if (!addresses.empty()) {
        ScanSession session(probe_, resolver_, options, std::move(addresses), cancel);
        result.summary = session.run(result.summary, result.devices);
    }
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (active_cancel_ == cancel) {
            active_cancel_.reset();
        }
    }

    std::sort(result.devices.begin(), result.devices.end(),
        [](const Device& a, const Device& b) { return a.address < b.address; });
    auto last = std::unique(result.devices.begin(), result.devices.end(),
        [](const Device& a, const Device& b) { return a.address == b.address; });
    result.devices.erase(last, result.devices.end());

    result.summary.respondCount = result.devices.size();
    result.summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - started);

    if (result.devices.empty() && !result.summary.capabilityUnavailable) {
        NETWATCH_LOG_WARN("discovery", "no device responded in " << range.toString()
                          << "; check that this host is connected and the range is correct");
    }
    NETWATCH_LOG_INFO("discovery", "sweep finished: " << result.summary.respondCount << " of "
                      << result.summary.addressesProbed << " addresses responded in "
                      << result.summary.elapsed.count() << " ms using "
                      << toString(result.summary.strategyUsed));
    return result;
}

} // namespace netwatch
