#include <gtest/gtest.h>

#include "netwatch/errors.hpp"
#include "netwatch/health_policy.hpp"

namespace netwatch {
namespace test {

class HealthPolicyTest : public ::testing::Test {
protected:
    HealthMetrics healthy() {
        HealthMetrics metrics;
        metrics.latencyMs = 15.0;
        metrics.packetLossPercent = 0.0;
        metrics.jitterMs = 0.0;
        metrics.uptimePercent = 100.0;
        return metrics;
    }

    HealthPolicy policy;
};

TEST_F(HealthPolicyTest, LatencyCurveBreakpoints) {
    const PiecewiseCurve& curve = policy.latencyCurve;
    EXPECT_DOUBLE_EQ(curve.evaluate(0), 100);
    EXPECT_DOUBLE_EQ(curve.evaluate(20), 100);
    EXPECT_DOUBLE_EQ(curve.evaluate(35), 90);
    EXPECT_DOUBLE_EQ(curve.evaluate(50), 80);
    EXPECT_DOUBLE_EQ(curve.evaluate(100), 50);
    EXPECT_DOUBLE_EQ(curve.evaluate(200), 25);
    EXPECT_DOUBLE_EQ(curve.evaluate(300), 0);
    EXPECT_DOUBLE_EQ(curve.evaluate(5000), 0);
}

TEST_F(HealthPolicyTest, JitterCurveBreakpoints) {
    const PiecewiseCurve& curve = policy.jitterCurve;
    EXPECT_DOUBLE_EQ(curve.evaluate(3), 100);
    EXPECT_DOUBLE_EQ(curve.evaluate(10), 80);
    EXPECT_DOUBLE_EQ(curve.evaluate(30), 50);
    EXPECT_DOUBLE_EQ(curve.evaluate(100), 0);
}

TEST_F(HealthPolicyTest, HealthyMetricsScoreFull) {
    EXPECT_EQ(compositeScore(scoreComponents(healthy(), policy), policy.weights), 100);
}

TEST_F(HealthPolicyTest, TotalLossCostsExactlyLossWeight) {
    HealthMetrics lossless = healthy();
    HealthMetrics lossy = healthy();
    lossy.packetLossPercent = 100.0;

    ComponentScores components = scoreComponents(lossy, policy);
    EXPECT_DOUBLE_EQ(components.packetLoss, 0.0);

    int full = compositeScore(scoreComponents(lossless, policy), policy.weights);
    int reduced = compositeScore(components, policy.weights);
    EXPECT_EQ(full - reduced, 30);
}

TEST_F(HealthPolicyTest, ScoreNonIncreasingInLatency) {
    int previous = 101;
    for (double latency : {1.0, 10.0, 20.0, 45.0, 80.0, 150.0, 200.0, 299.0, 400.0}) {
        HealthMetrics metrics = healthy();
        metrics.latencyMs = latency;
        int score = compositeScore(scoreComponents(metrics, policy), policy.weights);
        EXPECT_LE(score, previous) << "latency " << latency;
        previous = score;
    }
}

TEST_F(HealthPolicyTest, MissingLatencyScoresZeroComponents) {
    HealthMetrics metrics;
    metrics.packetLossPercent = 100.0;
    metrics.uptimePercent = 100.0;

    ComponentScores components = scoreComponents(metrics, policy);
    EXPECT_DOUBLE_EQ(components.latency, 0.0);
    EXPECT_DOUBLE_EQ(components.jitter, 0.0);
    EXPECT_EQ(compositeScore(components, policy.weights), 10);
}

TEST_F(HealthPolicyTest, Categories) {
    EXPECT_EQ(categorize(100), HealthCategory::Excellent);
    EXPECT_EQ(categorize(80), HealthCategory::Excellent);
    EXPECT_EQ(categorize(79), HealthCategory::Good);
    EXPECT_EQ(categorize(60), HealthCategory::Good);
    EXPECT_EQ(categorize(59), HealthCategory::Fair);
    EXPECT_EQ(categorize(40), HealthCategory::Fair);
    EXPECT_EQ(categorize(39), HealthCategory::Poor);
    EXPECT_EQ(categorize(0), HealthCategory::Poor);
}

TEST_F(HealthPolicyTest, AlertsFollowThresholds) {
    EXPECT_TRUE(collectAlerts(healthy(), policy.thresholds).empty());

    HealthMetrics metrics = healthy();
    metrics.latencyMs = 150.0;
    metrics.packetLossPercent = 20.0;
    metrics.jitterMs = 60.0;
    metrics.uptimePercent = 50.0;
    std::vector<std::string> alerts = collectAlerts(metrics, policy.thresholds);

    ASSERT_EQ(alerts.size(), 4u);
    EXPECT_EQ(alerts[0], "High latency: 150.0 ms");
    EXPECT_EQ(alerts[1], "Critical packet loss: 20.0%");
    EXPECT_EQ(alerts[2], "High jitter: 60.0 ms");
    EXPECT_EQ(alerts[3], "Low uptime: 50.0%");
}

TEST_F(HealthPolicyTest, ValidationRejectsBadPolicies) {
    EXPECT_NO_THROW(policy.validate());

    HealthPolicy unsorted;
    unsorted.latencyCurve = PiecewiseCurve{{0, 100}, {50, 80}, {20, 100}};
    EXPECT_THROW(unsorted.validate(), ConfigurationError);

    HealthPolicy weights;
    weights.weights.latency = 0.5;
    EXPECT_THROW(weights.validate(), ConfigurationError);

    HealthPolicy capacity;
    capacity.historyCapacity = 0;
    EXPECT_THROW(capacity.validate(), ConfigurationError);
}

} // namespace test
} // namespace netwatch
