#include "netwatch/health_engine.hpp"

#include "netwatch/errors.hpp"
#include "netwatch/log.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace netwatch {

namespace {

HealthPolicy validated(HealthPolicy policy) {
    policy.validate();
    return policy;
}

double mean_of(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

// Sample standard deviation; 0 with fewer than two values.
double stdev_of(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    double mean = mean_of(values);
    double sum = 0.0;
    for (double v : values) {
        sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sum / (values.size() - 1));
}

void put_optional(std::ostringstream& json, const char* key, const std::optional<double>& value) {
    json << "\"" << key << "\":";
    if (value) {
        json << *value;
    } else {
        json << "null";
    }
}

} // namespace

std::string HealthStatistics::toJson() const {
    std::ostringstream json;
    json << std::fixed << std::setprecision(2);
    json << "{";
    put_optional(json, "avg_latency", avgLatency);
    json << ",";
    put_optional(json, "min_latency", minLatency);
    json << ",";
    put_optional(json, "max_latency", maxLatency);
    json << ",\"total_tests\":" << totalTests;
    json << ",\"successful_tests\":" << successfulTests;
    json << ",\"success_rate\":" << successRate;
    json << "}";
    return json.str();
}

std::string StabilityReport::toJson() const {
    std::ostringstream json;
    json << std::fixed << std::setprecision(2);
    json << "{";
    json << "\"stability_score\":" << stabilityScore << ",";
    json << "\"disconnect_events\":" << disconnectEvents << ",";
    json << "\"total_downtime\":" << totalDowntimeSeconds << ",";
    json << "\"latency_variability\":" << latencyVariability << ",";
    json << "\"recommendation\":\"" << escapeJson(recommendation) << "\"";
    json << "}";
    return json.str();
}

HealthScoringEngine::HealthScoringEngine(ConnectivitySampler& sampler, HealthPolicy policy)
    : sampler_(sampler)
    , policy_(validated(std::move(policy)))
    , history_(policy_.historyCapacity)
{
}

HealthScoringEngine::~HealthScoringEngine() {
    stop();
}

void HealthScoringEngine::start(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        throw ConfigurationError("monitoring interval must be positive");
    }

    std::lock_guard<std::mutex> lock(loop_mutex_);
    if (state_ == MonitorState::Sampling) {
        return;
    }
    uint64_t run = ++run_id_;
    state_ = MonitorState::Sampling;
    worker_ = std::thread(&HealthScoringEngine::run_loop, this, interval, run);
    NETWATCH_LOG_INFO("health", "monitoring started (interval " << interval.count() << " ms)");
}

void HealthScoringEngine::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        if (state_ == MonitorState::Idle) {
            return;
        }
        ++run_id_;
        state_ = MonitorState::Idle;
        worker = std::move(worker_);
    }
    loop_cv_.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
    NETWATCH_LOG_INFO("health", "monitoring stopped");
}

MonitorState HealthScoringEngine::state() const {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    return state_;
}

void HealthScoringEngine::run_loop(std::chrono::milliseconds interval, uint64_t run) {
    for (;;) {
        try {
            HealthSnapshot snapshot = sampleOnce();
            NETWATCH_LOG_DEBUG("health", "score " << snapshot.score << " (" << toString(snapshot.category) << ")");
        } catch (const std::exception& e) {
            NETWATCH_LOG_ERROR("health", "sampling tick failed: " << e.what());
        }

        std::unique_lock<std::mutex> lock(loop_mutex_);
        if (loop_cv_.wait_for(lock, interval, [this, run] { return run_id_ != run; })) {
            return;
        }
    }
}

void HealthScoringEngine::recordSample(const LatencySample& sample) {
    std::lock_guard<std::mutex> lock(data_mutex_);
    batch_.push_back(sample);
    tick_sample_ = sample;
    while (batch_.size() > policy_.batchSize) {
        batch_.pop_front();
    }
}

void HealthScoringEngine::recordReachability(bool reachable) {
    std::lock_guard<std::mutex> lock(data_mutex_);
    reachability_.push_back(reachable);
    while (reachability_.size() > policy_.uptimeWindow) {
        reachability_.pop_front();
    }
}

HealthMetrics HealthScoringEngine::current_metrics() const {
    HealthMetrics metrics;

    std::vector<double> rtts;
    for (const auto& sample : batch_) {
        if (sample.roundTripMs) {
            rtts.push_back(*sample.roundTripMs);
        }
    }

    if (batch_.empty()) {
        metrics.packetLossPercent = 100.0;
    } else {
        metrics.packetLossPercent = 100.0 * (batch_.size() - rtts.size()) / batch_.size();
    }
    if (!rtts.empty()) {
        metrics.latencyMs = mean_of(rtts);
        metrics.jitterMs = stdev_of(rtts);
    }

    if (reachability_.empty()) {
        metrics.uptimePercent = 100.0;
    } else {
        size_t up = std::count(reachability_.begin(), reachability_.end(), true);
        metrics.uptimePercent = 100.0 * up / reachability_.size();
    }
    return metrics;
}

HealthSnapshot HealthScoringEngine::computeScore() {
    std::lock_guard<std::mutex> lock(data_mutex_);

    HealthMetrics metrics = current_metrics();

    HealthSnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    snapshot.attemptedSamples = static_cast<int>(batch_.size());
    snapshot.latencyMs = metrics.latencyMs;
    snapshot.packetLossPercent = metrics.packetLossPercent;
    snapshot.jitterMs = metrics.jitterMs.value_or(0.0);
    snapshot.uptimePercent = metrics.uptimePercent;
    if (tick_sample_) {
        snapshot.sampled = true;
        snapshot.sampleRoundTripMs = tick_sample_->roundTripMs;
        tick_sample_.reset();
    }

    if (batch_.empty()) {
        snapshot.score = 0;
        snapshot.alerts.push_back("No latency samples recorded yet");
    } else {
        snapshot.successfulSamples = static_cast<int>(
            std::count_if(batch_.begin(), batch_.end(),
                          [](const LatencySample& s) { return !s.lost(); }));
        snapshot.score = compositeScore(scoreComponents(metrics, policy_), policy_.weights);
        snapshot.alerts = collectAlerts(metrics, policy_.thresholds);
    }
    snapshot.category = categorize(snapshot.score);

    history_.append(snapshot);
    return snapshot;
}

HealthSnapshot HealthScoringEngine::sampleOnce() {
    std::lock_guard<std::mutex> tick(tick_mutex_);
    recordSample(sampler_.sample());
    recordReachability(sampler_.checkInternetReachable());
    return computeScore();
}

std::optional<HealthSnapshot> HealthScoringEngine::latest() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return history_.latest();
}

std::vector<HealthSnapshot> HealthScoringEngine::getHistory(std::optional<size_t> limit) const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return limit ? history_.tail(*limit) : history_.snapshot();
}

HealthStatistics HealthScoringEngine::getStatistics(std::optional<size_t> windowSize) const {
    std::vector<HealthSnapshot> window = getHistory(windowSize);

    HealthStatistics stats;
    for (const auto& snapshot : window) {
        if (!snapshot.sampled) {
            continue;
        }
        ++stats.totalTests;
        if (!snapshot.sampleRoundTripMs) {
            continue;
        }
        double latency = *snapshot.sampleRoundTripMs;
        ++stats.successfulTests;
        stats.minLatency = stats.minLatency ? std::min(*stats.minLatency, latency) : latency;
        stats.maxLatency = stats.maxLatency ? std::max(*stats.maxLatency, latency) : latency;
        stats.avgLatency = stats.avgLatency.value_or(0.0) + latency;
    }
    if (stats.successfulTests > 0) {
        stats.avgLatency = *stats.avgLatency / stats.successfulTests;
    }
    if (stats.totalTests > 0) {
        stats.successRate = 100.0 * stats.successfulTests / stats.totalTests;
    }
    return stats;
}

StabilityReport HealthScoringEngine::stability() const {
    std::vector<HealthSnapshot> window = getHistory();
    ConnectionState connection = sampler_.connectionState();

    StabilityReport report;
    if (window.empty()) {
        report.recommendation = "No history yet";
        return report;
    }

    report.disconnectEvents = connection.disconnectCount;
    report.totalDowntimeSeconds = connection.totalDowntime.count();

    std::vector<double> latencies;
    for (const auto& snapshot : window) {
        if (snapshot.sampleRoundTripMs) {
            latencies.push_back(*snapshot.sampleRoundTripMs);
        }
    }
    if (latencies.size() > 10) {
        double mean = mean_of(latencies);
        report.latencyVariability = mean > 0 ? stdev_of(latencies) / mean * 100.0 : 0.0;
    }

    if (report.disconnectEvents == 0 && report.latencyVariability < 20) {
        report.stabilityScore = 100;
        report.recommendation = "Connection is excellent and stable";
    } else if (report.disconnectEvents < 3 && report.latencyVariability < 40) {
        report.stabilityScore = 80;
        report.recommendation = "Connection is good with minor variation";
    } else if (report.disconnectEvents < 5 && report.latencyVariability < 60) {
        report.stabilityScore = 60;
        report.recommendation = "Connection is unstable, consider restarting the router";
    } else {
        report.stabilityScore = 40;
        report.recommendation = "Connection is very unstable, check cabling and equipment";
    }
    return report;
}

} // namespace netwatch
