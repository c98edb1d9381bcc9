#include "netwatch/connectivity_sampler.hpp"

#include "netwatch/errors.hpp"
#include "netwatch/log.hpp"

#include <future>
#include <iomanip>

namespace netwatch {

void SamplerOptions::validate() const {
    if (target.empty()) {
        throw ConfigurationError("sampling target must not be empty");
    }
    if (referenceHosts.empty()) {
        throw ConfigurationError("at least one reference host is required");
    }
    for (const auto& host : referenceHosts) {
        if (!Ipv4Address::parse(host)) {
            throw ConfigurationError("reference host must be an IPv4 address: '" + host + "'");
        }
    }
    if (sampleTimeout.count() <= 0 || reachabilityTimeout.count() <= 0) {
        throw ConfigurationError("sampling timeouts must be positive");
    }
}

ConnectivitySampler::ConnectivitySampler(ProbeExecutor& probe, HostnameResolver& resolver,
                                         SamplerOptions options)
    : probe_(probe)
    , resolver_(resolver)
    , options_(std::move(options))
{
    options_.validate();
    for (const auto& host : options_.referenceHosts) {
        references_.push_back(*Ipv4Address::parse(host));
    }
}

std::optional<double> ConnectivitySampler::probe_host(const Ipv4Address& address,
                                                      std::chrono::milliseconds timeout) {
    if (!icmp_unavailable_.load()) {
        ProbeResult result = probe_.probe(address, ProbeMethod::IcmpEcho, timeout);
        if (result.status != ProbeStatus::Unavailable) {
            return result.reachable() ? result.roundTripMs : std::nullopt;
        }
        if (!icmp_unavailable_.exchange(true)) {
            NETWATCH_LOG_WARN("sampler", "ICMP echo unavailable, using TCP connect probes");
        }
    }

    ProbeResult result = probe_.probe(address, ProbeMethod::TcpConnect, timeout);
    return result.reachable() ? result.roundTripMs : std::nullopt;
}

LatencySample ConnectivitySampler::sample(const std::string& target,
                                          std::chrono::milliseconds timeout) {
    if (target.empty()) {
        throw ConfigurationError("sampling target must not be empty");
    }
    if (timeout.count() <= 0) {
        throw ConfigurationError("sampling timeout must be positive");
    }

    LatencySample sample;
    sample.sequence = next_sequence_.fetch_add(1);
    sample.timestamp = std::chrono::system_clock::now();

    std::optional<Ipv4Address> address = Ipv4Address::parse(target);
    if (!address) {
        address = resolver_.forwardLookup(target, timeout);
    }
    if (!address) {
        NETWATCH_LOG_DEBUG("sampler", "could not resolve " << target << ", recording loss");
        return sample;
    }

    sample.roundTripMs = probe_host(*address, timeout);
    if (sample.roundTripMs) {
        NETWATCH_LOG_DEBUG("sampler", "ping " << target << " #" << sample.sequence << ": "
                           << std::fixed << std::setprecision(2) << *sample.roundTripMs << " ms");
    } else {
        NETWATCH_LOG_DEBUG("sampler", "ping " << target << " #" << sample.sequence << ": lost");
    }
    return sample;
}

LatencySample ConnectivitySampler::sample() {
    return sample(options_.target, options_.sampleTimeout);
}

std::vector<std::optional<double>> ConnectivitySampler::probe_references() {
    std::vector<std::future<std::optional<double>>> pending;
    pending.reserve(references_.size());
    for (const auto& reference : references_) {
        pending.push_back(std::async(std::launch::async, [this, reference] {
            return probe_host(reference, options_.reachabilityTimeout);
        }));
    }

    std::vector<std::optional<double>> results;
    results.reserve(pending.size());
    for (auto& future : pending) {
        results.push_back(future.get());
    }
    return results;
}

bool ConnectivitySampler::checkInternetReachable() {
    bool reachable = false;
    for (const auto& rtt : probe_references()) {
        if (rtt) {
            reachable = true;
        }
    }
    update_state(reachable);
    return reachable;
}

std::optional<HostLatency> ConnectivitySampler::findFastestHost() {
    std::vector<std::optional<double>> results = probe_references();

    std::optional<HostLatency> fastest;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i] && (!fastest || *results[i] < fastest->roundTripMs)) {
            fastest = HostLatency{options_.referenceHosts[i], *results[i]};
        }
    }
    if (fastest) {
        NETWATCH_LOG_INFO("sampler", "fastest reference host: " << fastest->host << " ("
                          << std::fixed << std::setprecision(2) << fastest->roundTripMs << " ms)");
    }
    return fastest;
}

std::optional<double> ConnectivitySampler::measureDnsResolution(const std::string& domain) {
    auto started = std::chrono::steady_clock::now();
    std::optional<Ipv4Address> address = resolver_.forwardLookup(domain, options_.sampleTimeout);
    if (!address) {
        NETWATCH_LOG_WARN("sampler", "DNS resolution failed for " << domain);
        return std::nullopt;
    }
    std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
    NETWATCH_LOG_DEBUG("sampler", "DNS resolution for " << domain << ": " << elapsed.count() << " ms");
    return elapsed.count();
}

std::optional<double> ConnectivitySampler::measureDnsResolution() {
    return measureDnsResolution(options_.dnsTestDomain);
}

ConnectionState ConnectivitySampler::connectionState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void ConnectivitySampler::update_state(bool reachable) {
    auto now = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (reachable) {
        if (state_.everChecked && !state_.connected) {
            NETWATCH_LOG_INFO("sampler", "connection restored");
            if (state_.lastDisconnected) {
                state_.totalDowntime += now - *state_.lastDisconnected;
            }
        }
        state_.connected = true;
        state_.lastConnected = now;
    } else {
        if (state_.connected) {
            NETWATCH_LOG_WARN("sampler", "connection lost to all reference hosts");
            ++state_.disconnectCount;
            state_.lastDisconnected = now;
        } else if (!state_.everChecked) {
            state_.lastDisconnected = now;
        }
        state_.connected = false;
    }
    state_.everChecked = true;
}

} // namespace netwatch
