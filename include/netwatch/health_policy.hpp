#ifndef NETWATCH_HEALTH_POLICY_HPP
#define NETWATCH_HEALTH_POLICY_HPP

#include "netwatch/types.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace netwatch {

struct Breakpoint {
    double x;
    double score;
};

// Piecewise-linear mapping from a measurement (ms) to a 0..100 score.
// Below the first breakpoint the first score applies, beyond the last the
// last score applies.
class PiecewiseCurve {
public:
    PiecewiseCurve() = default;
    PiecewiseCurve(std::initializer_list<Breakpoint> points);
    explicit PiecewiseCurve(std::vector<Breakpoint> points);

    double evaluate(double x) const;
    const std::vector<Breakpoint>& points() const noexcept { return points_; }

    // Throws ConfigurationError unless x is strictly increasing and every
    // score lies in [0, 100].
    void validate() const;

private:
    std::vector<Breakpoint> points_;
};

struct HealthWeights {
    double latency = 0.40;
    double packetLoss = 0.30;
    double jitter = 0.20;
    double uptime = 0.10;
};

struct AlertThresholds {
    double latencyWarningMs = 100.0;
    double latencyCriticalMs = 300.0;
    double lossWarningPercent = 5.0;
    double lossCriticalPercent = 15.0;
    double jitterWarningMs = 50.0;
    double jitterCriticalMs = 100.0;
    double uptimeWarningPercent = 80.0;
};

struct HealthPolicy {
    PiecewiseCurve latencyCurve{{0, 100}, {20, 100}, {50, 80}, {100, 50}, {300, 0}};
    PiecewiseCurve jitterCurve{{0, 100}, {5, 100}, {10, 80}, {30, 50}, {100, 0}};
    HealthWeights weights;
    AlertThresholds thresholds;
    size_t batchSize = 10;          // latency samples per score
    size_t uptimeWindow = 100;      // reachability checks remembered
    size_t historyCapacity = 60;    // snapshots kept

    void validate() const;
};

// Raw measurements over one evaluation batch.
struct HealthMetrics {
    std::optional<double> latencyMs;   // mean RTT, absent when nothing answered
    double packetLossPercent = 0.0;
    std::optional<double> jitterMs;
    double uptimePercent = 100.0;
};

struct ComponentScores {
    double latency = 0.0;
    double packetLoss = 0.0;
    double jitter = 0.0;
    double uptime = 0.0;
};

ComponentScores scoreComponents(const HealthMetrics& metrics, const HealthPolicy& policy);

// Weighted sum rounded to the nearest integer and clamped to [0, 100].
int compositeScore(const ComponentScores& components, const HealthWeights& weights);

HealthCategory categorize(int score);

std::vector<std::string> collectAlerts(const HealthMetrics& metrics, const AlertThresholds& thresholds);

} // namespace netwatch

#endif
