#include <gtest/gtest.h>

#include "fakes.hpp"
#include "netwatch/device_discovery.hpp"
#include "netwatch/errors.hpp"

#include <future>

namespace netwatch {
namespace test {

class DeviceDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.strategy = DiscoveryStrategy::PingOnly;
        options.probeTimeout = std::chrono::milliseconds(50);
        options.resolveTimeout = std::chrono::milliseconds(50);
    }

    std::vector<std::string> addressesOf(const DiscoveryResult& result) {
        std::vector<std::string> out;
        for (const auto& device : result.devices) {
            out.push_back(device.address.toString());
        }
        return out;
    }

    FakeProbeExecutor probe;
    FakeResolver resolver;
    DiscoveryOptions options;
};

TEST_F(DeviceDiscoveryTest, SmallRangeReturnsBothHostsSorted) {
    probe.setReachable("10.0.0.2");
    probe.setReachable("10.0.0.1");
    DeviceDiscoveryEngine engine(probe, resolver);

    DiscoveryResult result = engine.discover(Cidr::parse("10.0.0.0/30"), options);

    ASSERT_EQ(result.deviceCount(), 2u);
    EXPECT_EQ(addressesOf(result), (std::vector<std::string>{"10.0.0.1", "10.0.0.2"}));
    EXPECT_EQ(result.summary.addressesProbed, 2u);
    EXPECT_EQ(result.summary.respondCount, 2u);
    EXPECT_TRUE(result.devices[0].reachable);
}

TEST_F(DeviceDiscoveryTest, ResultIndependentOfConcurrency) {
    const std::vector<std::string> reachable = {
        "192.168.5.3", "192.168.5.17", "192.168.5.18", "192.168.5.40", "192.168.5.254"};
    for (const auto& address : reachable) {
        probe.setReachable(address);
    }
    DeviceDiscoveryEngine engine(probe, resolver);

    for (int k : {1, 2, 7, 30, 64, 300}) {
        options.concurrency = k;
        DiscoveryResult result = engine.discover(Cidr::parse("192.168.5.0/24"), options);
        EXPECT_EQ(addressesOf(result), reachable) << "concurrency " << k;
        EXPECT_EQ(result.summary.addressesProbed, 254u) << "concurrency " << k;
    }
}

TEST_F(DeviceDiscoveryTest, FallsBackToPingWhenArpUnavailable) {
    probe.setUnavailable(ProbeMethod::Arp);
    probe.setReachable("10.1.0.5");
    options.strategy = DiscoveryStrategy::Auto;
    DeviceDiscoveryEngine engine(probe, resolver);

    DiscoveryResult result = engine.discover(Cidr::parse("10.1.0.0/28"), options);

    EXPECT_EQ(result.summary.strategyUsed, DiscoveryStrategy::PingOnly);
    EXPECT_FALSE(result.summary.capabilityUnavailable);
    EXPECT_EQ(addressesOf(result), (std::vector<std::string>{"10.1.0.5"}));

    // Only the capability check used ARP; every address went out over ICMP.
    EXPECT_EQ(probe.callCount(ProbeMethod::Arp), 1u);
    EXPECT_EQ(probe.callCount(ProbeMethod::IcmpEcho), 14u);
    std::vector<FakeProbeExecutor::Call> calls = probe.calls();
    for (size_t i = 1; i < calls.size(); ++i) {
        EXPECT_EQ(calls[i].method, ProbeMethod::IcmpEcho);
    }
}

TEST_F(DeviceDiscoveryTest, ArpOnlyWithoutPrivilegeReportsCapabilityUnavailable) {
    probe.setUnavailable(ProbeMethod::Arp);
    probe.setReachable("10.1.0.5");
    options.strategy = DiscoveryStrategy::ArpOnly;
    DeviceDiscoveryEngine engine(probe, resolver);

    DiscoveryResult result = engine.discover(Cidr::parse("10.1.0.0/28"), options);

    EXPECT_TRUE(result.devices.empty());
    EXPECT_TRUE(result.summary.capabilityUnavailable);
    EXPECT_EQ(result.summary.strategyUsed, DiscoveryStrategy::ArpOnly);
    EXPECT_EQ(probe.callCount(ProbeMethod::IcmpEcho), 0u);
}

TEST_F(DeviceDiscoveryTest, ArpCarriesPhysicalAddress) {
    probe.setReachable("10.2.0.1");
    options.strategy = DiscoveryStrategy::Auto;
    DeviceDiscoveryEngine engine(probe, resolver);

    DiscoveryResult result = engine.discover(Cidr::parse("10.2.0.0/30"), options);

    EXPECT_EQ(result.summary.strategyUsed, DiscoveryStrategy::ArpOnly);
    ASSERT_EQ(result.deviceCount(), 1u);
    ASSERT_TRUE(result.devices[0].physicalAddress);
    EXPECT_EQ(*result.devices[0].physicalAddress, "aa:bb:cc:00:00:1");
}

TEST_F(DeviceDiscoveryTest, EmptyResultIsNotAnError) {
    DeviceDiscoveryEngine engine(probe, resolver);

    DiscoveryResult result = engine.discover(Cidr::parse("10.3.0.0/29"), options);

    EXPECT_TRUE(result.devices.empty());
    EXPECT_FALSE(result.summary.capabilityUnavailable);
    EXPECT_FALSE(result.summary.timedOut);
    EXPECT_EQ(result.summary.addressesProbed, 6u);
}

TEST_F(DeviceDiscoveryTest, MaxAddressesTruncatesSweep) {
    probe.setReachable("10.4.0.3");
    probe.setReachable("10.4.0.200");
    options.maxAddresses = 10;
    DeviceDiscoveryEngine engine(probe, resolver);

    DiscoveryResult result = engine.discover(Cidr::parse("10.4.0.0/24"), options);

    EXPECT_TRUE(result.summary.truncated);
    EXPECT_EQ(result.summary.addressesProbed, 10u);
    EXPECT_EQ(addressesOf(result), (std::vector<std::string>{"10.4.0.3"}));
}

TEST_F(DeviceDiscoveryTest, HostnamesResolvedWhenAvailable) {
    probe.setReachable("10.5.0.1");
    probe.setReachable("10.5.0.2");
    resolver.addName("10.5.0.1", "router.lan");
    DeviceDiscoveryEngine engine(probe, resolver);

    DiscoveryResult result = engine.discover(Cidr::parse("10.5.0.0/30"), options);

    const Device* router = result.findDevice(ip("10.5.0.1"));
    ASSERT_NE(router, nullptr);
    ASSERT_TRUE(router->hostname);
    EXPECT_EQ(*router->hostname, "router.lan");

    const Device* other = result.findDevice(ip("10.5.0.2"));
    ASSERT_NE(other, nullptr);
    EXPECT_FALSE(other->hostname);

    EXPECT_EQ(result.findDevice(ip("10.5.0.3")), nullptr);
}

TEST_F(DeviceDiscoveryTest, NoResolveSkipsLookups) {
    probe.setReachable("10.5.0.1");
    resolver.addName("10.5.0.1", "router.lan");
    options.resolveHostnames = false;
    DeviceDiscoveryEngine engine(probe, resolver);

    DiscoveryResult result = engine.discover(Cidr::parse("10.5.0.0/30"), options);

    ASSERT_EQ(result.deviceCount(), 1u);
    EXPECT_FALSE(result.devices[0].hostname);
}

TEST_F(DeviceDiscoveryTest, SweepTimeoutReturnsPartialResults) {
    probe.setReachable("10.6.0.1");
    probe.setDelay(std::chrono::milliseconds(100));
    options.concurrency = 1;
    options.sweepTimeout = std::chrono::milliseconds(250);
    DeviceDiscoveryEngine engine(probe, resolver);

    DiscoveryResult result = engine.discover(Cidr::parse("10.6.0.0/24"), options);

    EXPECT_TRUE(result.summary.timedOut);
    EXPECT_LT(result.summary.addressesProbed, 254u);
    EXPECT_EQ(addressesOf(result), (std::vector<std::string>{"10.6.0.1"}));
    // At most one in-flight probe past the deadline.
    EXPECT_LT(result.summary.elapsed, options.sweepTimeout + std::chrono::milliseconds(100) +
                                          std::chrono::milliseconds(400));
}

TEST_F(DeviceDiscoveryTest, CancelStopsSweep) {
    probe.setDelay(std::chrono::milliseconds(20));
    options.concurrency = 1;
    DeviceDiscoveryEngine engine(probe, resolver);

    auto sweep = std::async(std::launch::async, [&] {
        return engine.discover(Cidr::parse("10.7.0.0/24"), options);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    engine.cancel();

    DiscoveryResult result = sweep.get();
    EXPECT_TRUE(result.summary.cancelled);
    EXPECT_LT(result.summary.addressesProbed, 254u);
}

TEST_F(DeviceDiscoveryTest, CancelBeforeSweepDoesNotCarryOver) {
    probe.setReachable("10.8.0.1");
    DeviceDiscoveryEngine engine(probe, resolver);

    engine.cancel();
    DiscoveryResult result = engine.discover(Cidr::parse("10.8.0.0/30"), options);

    EXPECT_FALSE(result.summary.cancelled);
    EXPECT_EQ(result.summary.addressesProbed, 2u);
    EXPECT_EQ(addressesOf(result), (std::vector<std::string>{"10.8.0.1"}));
}

TEST_F(DeviceDiscoveryTest, CancelDuringFirstProbeIsHonoured) {
    probe.setDelay(std::chrono::milliseconds(200));
    options.concurrency = 1;
    DeviceDiscoveryEngine engine(probe, resolver);

    auto sweep = std::async(std::launch::async, [&] {
        return engine.discover(Cidr::parse("10.9.0.0/28"), options);
    });
    // Lands while the capability check on the first address is running.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    engine.cancel();

    DiscoveryResult result = sweep.get();
    EXPECT_TRUE(result.summary.cancelled);
    EXPECT_LT(result.summary.addressesProbed, 14u);
}

TEST_F(DeviceDiscoveryTest, InvalidOptionsRejected) {
    DeviceDiscoveryEngine engine(probe, resolver);
    options.concurrency = 0;
    EXPECT_THROW(engine.discover(Cidr::parse("10.0.0.0/30"), options), ConfigurationError);
    EXPECT_TRUE(probe.calls().empty());
}

TEST(StrategySelectorTest, FallbackOnlyFromAuto) {
    StrategySelector automatic(DiscoveryStrategy::Auto);
    EXPECT_EQ(automatic.method(), ProbeMethod::Arp);
    EXPECT_TRUE(automatic.canFallBack());
    automatic.fallBack();
    EXPECT_EQ(automatic.state(), StrategySelector::State::Fallback);
    EXPECT_EQ(automatic.method(), ProbeMethod::IcmpEcho);
    EXPECT_FALSE(automatic.canFallBack());

    StrategySelector arp(DiscoveryStrategy::ArpOnly);
    EXPECT_FALSE(arp.canFallBack());
    arp.fallBack();
    EXPECT_EQ(arp.method(), ProbeMethod::Arp);

    StrategySelector ping(DiscoveryStrategy::PingOnly);
    EXPECT_EQ(ping.method(), ProbeMethod::IcmpEcho);
    EXPECT_EQ(ping.effectiveStrategy(), DiscoveryStrategy::PingOnly);
}

TEST(StrategyNameTest, ParsesNames) {
    DiscoveryStrategy strategy = DiscoveryStrategy::Auto;
    EXPECT_TRUE(parseStrategy("ARP", strategy));
    EXPECT_EQ(strategy, DiscoveryStrategy::ArpOnly);
    EXPECT_TRUE(parseStrategy("ping", strategy));
    EXPECT_EQ(strategy, DiscoveryStrategy::PingOnly);
    EXPECT_FALSE(parseStrategy("nmap", strategy));
    EXPECT_STREQ(toString(DiscoveryStrategy::Auto), "auto");
}

} // namespace test
} // namespace netwatch
