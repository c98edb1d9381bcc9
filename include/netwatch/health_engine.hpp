#ifndef NETWATCH_HEALTH_ENGINE_HPP
#define NETWATCH_HEALTH_ENGINE_HPP

#include "netwatch/connectivity_sampler.hpp"
#include "netwatch/health_policy.hpp"
#include "netwatch/history_window.hpp"
#include "netwatch/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace netwatch {

enum class MonitorState { Idle, Sampling };

struct HealthStatistics {
    std::optional<double> avgLatency;
    std::optional<double> minLatency;
    std::optional<double> maxLatency;
    double successRate = 0.0;      // percent of sampled ticks that got a reply
    size_t totalTests = 0;
    size_t successfulTests = 0;

    std::string toJson() const;
};

struct StabilityReport {
    int stabilityScore = 100;
    int disconnectEvents = 0;
    double totalDowntimeSeconds = 0.0;
    double latencyVariability = 0.0;   // coefficient of variation, percent
    std::string recommendation;

    std::string toJson() const;
};

class HealthScoringEngine {
public:
    explicit HealthScoringEngine(ConnectivitySampler& sampler, HealthPolicy policy = HealthPolicy());
    ~HealthScoringEngine();

    HealthScoringEngine(const HealthScoringEngine&) = delete;
    HealthScoringEngine& operator=(const HealthScoringEngine&) = delete;

    // Idle -> Sampling. A no-op while already sampling. Safe to call while
    // another thread is still inside stop(); the old loop still exits.
    void start(std::chrono::milliseconds interval);
    // Sampling -> Idle; lets the in-flight tick finish. A no-op while idle.
    void stop();
    MonitorState state() const;

    // Adds the sample to the scoring batch; the next computeScore() also
    // records it as that snapshot's own tick sample.
    void recordSample(const LatencySample& sample);
    void recordReachability(bool reachable);

    // Scores the current batch and appends the snapshot to the history.
    HealthSnapshot computeScore();

    // One tick: sample the target, check reachability, score.
    HealthSnapshot sampleOnce();

    std::optional<HealthSnapshot> latest() const;
    std::vector<HealthSnapshot> getHistory(std::optional<size_t> limit = std::nullopt) const;
    HealthStatistics getStatistics(std::optional<size_t> windowSize = std::nullopt) const;
    StabilityReport stability() const;

    const HealthPolicy& policy() const noexcept { return policy_; }

private:
    HealthMetrics current_metrics() const;
    void run_loop(std::chrono::milliseconds interval, uint64_t run);

    ConnectivitySampler& sampler_;
    const HealthPolicy policy_;

    mutable std::mutex data_mutex_;      // batch_, reachability_, history_
    std::deque<LatencySample> batch_;
    std::deque<bool> reachability_;
    std::optional<LatencySample> tick_sample_;
    HistoryWindow history_;

    std::mutex tick_mutex_;              // serializes manual and periodic ticks

    mutable std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    uint64_t run_id_ = 0;                // a loop exits once this moves past its own id
    MonitorState state_ = MonitorState::Idle;
    std::thread worker_;
};

} // namespace netwatch

#endif
