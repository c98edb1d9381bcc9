#include <gtest/gtest.h>

#include "fakes.hpp"
#include "netwatch/errors.hpp"
#include "netwatch/health_engine.hpp"

#include <future>

namespace netwatch {
namespace test {

class HealthScoringEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.sampleTimeout = std::chrono::milliseconds(20);
        options.reachabilityTimeout = std::chrono::milliseconds(20);
        sampler = std::make_unique<ConnectivitySampler>(probe, resolver, options);
    }

    static LatencySample rtt(double ms) {
        LatencySample sample;
        sample.timestamp = std::chrono::system_clock::now();
        sample.roundTripMs = ms;
        return sample;
    }

    static LatencySample loss() {
        LatencySample sample;
        sample.timestamp = std::chrono::system_clock::now();
        return sample;
    }

    FakeProbeExecutor probe;
    FakeResolver resolver;
    SamplerOptions options;
    std::unique_ptr<ConnectivitySampler> sampler;
};

TEST_F(HealthScoringEngineTest, SteadyLowLatencyIsExcellent) {
    HealthScoringEngine engine(*sampler);
    for (int i = 0; i < 10; ++i) {
        engine.recordSample(rtt(15.0));
    }

    HealthSnapshot snapshot = engine.computeScore();

    EXPECT_EQ(snapshot.score, 100);
    EXPECT_EQ(snapshot.category, HealthCategory::Excellent);
    EXPECT_DOUBLE_EQ(snapshot.packetLossPercent, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.jitterMs, 0.0);
    EXPECT_DOUBLE_EQ(*snapshot.latencyMs, 15.0);
    EXPECT_EQ(snapshot.successfulSamples, 10);
    EXPECT_TRUE(snapshot.alerts.empty());
}

TEST_F(HealthScoringEngineTest, LowerLatencyNeverScoresWorse) {
    HealthScoringEngine fast(*sampler);
    HealthScoringEngine slow(*sampler);
    for (int i = 0; i < 10; ++i) {
        fast.recordSample(rtt(10.0));
        slow.recordSample(rtt(200.0));
    }
    EXPECT_GE(fast.computeScore().score, slow.computeScore().score);
}

TEST_F(HealthScoringEngineTest, EmptyBatchIsPoor) {
    HealthScoringEngine engine(*sampler);

    HealthSnapshot snapshot = engine.computeScore();

    EXPECT_EQ(snapshot.score, 0);
    EXPECT_EQ(snapshot.category, HealthCategory::Poor);
    EXPECT_DOUBLE_EQ(snapshot.packetLossPercent, 100.0);
    EXPECT_FALSE(snapshot.alerts.empty());
}

TEST_F(HealthScoringEngineTest, LossAndJitterMeasuredOverBatch) {
    HealthScoringEngine engine(*sampler);
    engine.recordSample(rtt(10.0));
    engine.recordSample(rtt(30.0));
    engine.recordSample(loss());
    engine.recordSample(loss());

    HealthSnapshot snapshot = engine.computeScore();

    EXPECT_DOUBLE_EQ(snapshot.packetLossPercent, 50.0);
    EXPECT_DOUBLE_EQ(*snapshot.latencyMs, 20.0);
    EXPECT_NEAR(snapshot.jitterMs, 14.142, 0.001);
    EXPECT_EQ(snapshot.attemptedSamples, 4);
    EXPECT_EQ(snapshot.successfulSamples, 2);
}

TEST_F(HealthScoringEngineTest, BatchKeepsMostRecentSamples) {
    HealthPolicy policy;
    policy.batchSize = 3;
    HealthScoringEngine engine(*sampler, policy);
    engine.recordSample(loss());
    engine.recordSample(loss());
    for (int i = 0; i < 3; ++i) {
        engine.recordSample(rtt(15.0));
    }

    EXPECT_DOUBLE_EQ(engine.computeScore().packetLossPercent, 0.0);
}

TEST_F(HealthScoringEngineTest, UptimeFromReachabilityWindow) {
    HealthPolicy policy;
    policy.uptimeWindow = 4;
    HealthScoringEngine engine(*sampler, policy);
    engine.recordSample(rtt(15.0));
    engine.recordReachability(false);
    engine.recordReachability(false);
    engine.recordReachability(true);
    engine.recordReachability(true);
    engine.recordReachability(true);

    EXPECT_DOUBLE_EQ(engine.computeScore().uptimePercent, 75.0);
}

TEST_F(HealthScoringEngineTest, HistoryEvictsOldestSnapshot) {
    HealthPolicy policy;
    policy.historyCapacity = 3;
    HealthScoringEngine engine(*sampler, policy);

    std::vector<HealthSnapshot> appended;
    for (int i = 0; i < 4; ++i) {
        engine.recordSample(rtt(10.0 + 100.0 * i));
        appended.push_back(engine.computeScore());
    }

    std::vector<HealthSnapshot> history = engine.getHistory();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_DOUBLE_EQ(*history.front().latencyMs, *appended[1].latencyMs);
    EXPECT_DOUBLE_EQ(*history.back().latencyMs, *appended[3].latencyMs);

    std::vector<HealthSnapshot> last = engine.getHistory(size_t(1));
    ASSERT_EQ(last.size(), 1u);
    EXPECT_DOUBLE_EQ(*last[0].latencyMs, *appended[3].latencyMs);
}

TEST_F(HealthScoringEngineTest, SampleOnceUsesSampler) {
    probe.setReachable("8.8.8.8", 12.0);
    HealthScoringEngine engine(*sampler);

    HealthSnapshot snapshot = engine.sampleOnce();

    ASSERT_TRUE(snapshot.latencyMs);
    EXPECT_DOUBLE_EQ(*snapshot.latencyMs, 12.0);
    EXPECT_DOUBLE_EQ(snapshot.uptimePercent, 100.0);
    ASSERT_TRUE(engine.latest());
    EXPECT_EQ(engine.latest()->score, snapshot.score);
}

TEST_F(HealthScoringEngineTest, StartAndStopAreIdempotent) {
    probe.setReachable("8.8.8.8", 5.0);
    HealthScoringEngine engine(*sampler);

    EXPECT_EQ(engine.state(), MonitorState::Idle);
    engine.stop();
    EXPECT_EQ(engine.state(), MonitorState::Idle);

    engine.start(std::chrono::milliseconds(20));
    engine.start(std::chrono::milliseconds(20));
    EXPECT_EQ(engine.state(), MonitorState::Sampling);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    engine.stop();
    engine.stop();
    EXPECT_EQ(engine.state(), MonitorState::Idle);

    size_t ticks = engine.getHistory().size();
    EXPECT_GE(ticks, 1u);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(engine.getHistory().size(), ticks);
}

TEST_F(HealthScoringEngineTest, RestartDuringStopDoesNotStrandOldLoop) {
    probe.setReachable("8.8.8.8", 5.0);
    probe.setDelay(std::chrono::milliseconds(100));
    HealthScoringEngine engine(*sampler);

    engine.start(std::chrono::milliseconds(20));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    std::future<void> stopping = std::async(std::launch::async, [&engine] { engine.stop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    engine.start(std::chrono::milliseconds(20));

    EXPECT_EQ(stopping.wait_for(std::chrono::seconds(3)), std::future_status::ready);

    engine.stop();
    EXPECT_EQ(engine.state(), MonitorState::Idle);
    stopping.get();
}

TEST_F(HealthScoringEngineTest, NonPositiveIntervalRejected) {
    HealthScoringEngine engine(*sampler);
    EXPECT_THROW(engine.start(std::chrono::milliseconds(0)), ConfigurationError);
    EXPECT_EQ(engine.state(), MonitorState::Idle);
}

TEST_F(HealthScoringEngineTest, StatisticsOverWindow) {
    HealthScoringEngine engine(*sampler);
    engine.computeScore();   // no sample of its own: not a test
    for (double ms : {10.0, 20.0, 30.0}) {
        engine.recordSample(rtt(ms));
        engine.computeScore();
    }
    engine.recordSample(loss());
    engine.computeScore();

    HealthStatistics all = engine.getStatistics();
    EXPECT_EQ(all.totalTests, 4u);
    EXPECT_EQ(all.successfulTests, 3u);
    EXPECT_DOUBLE_EQ(all.successRate, 75.0);
    EXPECT_DOUBLE_EQ(*all.minLatency, 10.0);
    EXPECT_DOUBLE_EQ(*all.avgLatency, 20.0);

    HealthStatistics window = engine.getStatistics(size_t(2));
    EXPECT_EQ(window.totalTests, 2u);
    EXPECT_DOUBLE_EQ(window.successRate, 50.0);

    HealthStatistics clamped = engine.getStatistics(size_t(500));
    EXPECT_EQ(clamped.totalTests, 4u);
}

TEST_F(HealthScoringEngineTest, StatisticsUseEachTickSampleNotBatchMean) {
    HealthScoringEngine engine(*sampler);
    for (int i = 0; i < 20; ++i) {
        if (i % 2 == 0) {
            engine.recordSample(loss());
        } else {
            engine.recordSample(rtt(i % 4 == 1 ? 10.0 : 90.0));
        }
        engine.computeScore();
    }

    HealthStatistics stats = engine.getStatistics();
    EXPECT_EQ(stats.totalTests, 20u);
    EXPECT_EQ(stats.successfulTests, 10u);
    EXPECT_DOUBLE_EQ(stats.successRate, 50.0);
    EXPECT_DOUBLE_EQ(*stats.minLatency, 10.0);
    EXPECT_DOUBLE_EQ(*stats.maxLatency, 90.0);
    EXPECT_DOUBLE_EQ(*stats.avgLatency, 50.0);

    HealthSnapshot last = engine.getHistory().back();
    EXPECT_TRUE(last.sampled);
    ASSERT_TRUE(last.sampleRoundTripMs);
    EXPECT_DOUBLE_EQ(*last.sampleRoundTripMs, 90.0);
}

TEST_F(HealthScoringEngineTest, StatisticsEmptyHistory) {
    HealthScoringEngine engine(*sampler);
    HealthStatistics stats = engine.getStatistics();
    EXPECT_EQ(stats.totalTests, 0u);
    EXPECT_FALSE(stats.avgLatency);
    EXPECT_DOUBLE_EQ(stats.successRate, 0.0);
}

TEST_F(HealthScoringEngineTest, StabilityOfSteadyConnection) {
    HealthScoringEngine engine(*sampler);
    EXPECT_EQ(engine.stability().recommendation, "No history yet");

    for (int i = 0; i < 12; ++i) {
        engine.recordSample(rtt(20.0));
        engine.computeScore();
    }
    StabilityReport report = engine.stability();
    EXPECT_EQ(report.stabilityScore, 100);
    EXPECT_EQ(report.disconnectEvents, 0);
    EXPECT_DOUBLE_EQ(report.latencyVariability, 0.0);
}

} // namespace test
} // namespace netwatch
