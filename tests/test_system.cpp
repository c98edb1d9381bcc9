#include <gtest/gtest.h>

#include "netwatch/system.hpp"
#include "system_probe_internal.hpp"

#include <arpa/inet.h>

#include <cstring>

namespace netwatch {
namespace test {

class SystemCommandRunnerTest : public ::testing::Test {
protected:
    SystemCommandRunner runner;
    const std::chrono::milliseconds timeout{2000};
};

TEST_F(SystemCommandRunnerTest, CapturesStandardOutput) {
    CommandResult result = runner.run({"echo", "hello"}, timeout);

    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.timedOut);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "hello\n");
    EXPECT_TRUE(result.succeeded());
}

TEST_F(SystemCommandRunnerTest, ReportsNonZeroExit) {
    CommandResult result = runner.run({"false"}, timeout);

    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_FALSE(result.succeeded());
}

TEST_F(SystemCommandRunnerTest, MissingExecutableIsNotLaunched) {
    CommandResult result = runner.run({"netwatch-no-such-tool"}, timeout);

    EXPECT_FALSE(result.launched);
    EXPECT_FALSE(result.succeeded());
}

TEST_F(SystemCommandRunnerTest, EmptyArgvIsNotLaunched) {
    EXPECT_FALSE(runner.run({}, timeout).launched);
}

TEST_F(SystemCommandRunnerTest, KillsChildAfterTimeout) {
    auto started = std::chrono::steady_clock::now();

    CommandResult result = runner.run({"sleep", "5"}, std::chrono::milliseconds(100));

    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.timedOut);
    EXPECT_FALSE(result.succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(PingOutputTest, ParsesRoundTrip) {
    EXPECT_DOUBLE_EQ(*internal::parsePingTime(
                         "64 bytes from 8.8.8.8: icmp_seq=1 ttl=117 time=12.3 ms\n"),
                     12.3);
    EXPECT_DOUBLE_EQ(*internal::parsePingTime("Reply from 10.0.0.1: bytes=32 time<1ms TTL=64"), 1.0);
}

TEST(PingOutputTest, NoRoundTrip) {
    EXPECT_FALSE(internal::parsePingTime("Request timeout for icmp_seq 0"));
    EXPECT_FALSE(internal::parsePingTime("time=unknown"));
    EXPECT_FALSE(internal::parsePingTime(""));
}

TEST(IcmpChecksumTest, KnownVector) {
    const uint8_t data[] = {0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7};
    EXPECT_EQ(ntohs(internal::icmpChecksum(data, sizeof(data))), 0x220d);

    const uint8_t odd[] = {0x01};
    EXPECT_EQ(ntohs(internal::icmpChecksum(odd, sizeof(odd))), 0xfeff);
}

TEST(IcmpChecksumTest, PacketWithChecksumVerifiesToZero) {
    uint8_t packet[] = {8, 0, 0, 0, 0x12, 0x34, 0x00, 0x01, 'n', 'w'};
    uint16_t checksum = internal::icmpChecksum(packet, sizeof(packet));
    std::memcpy(packet + 2, &checksum, sizeof(checksum));

    EXPECT_EQ(internal::icmpChecksum(packet, sizeof(packet)), 0);
}

} // namespace test
} // namespace netwatch
