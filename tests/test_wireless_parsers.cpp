#include <gtest/gtest.h>

#include "netwatch/wireless_parsers.hpp"

namespace netwatch {
namespace test {

TEST(SecurityTest, NormalisesFreeText) {
    EXPECT_EQ(parseSecurity("WPA2 WPA3"), Security::WPA3);
    EXPECT_EQ(parseSecurity("SAE"), Security::WPA3);
    EXPECT_EQ(parseSecurity("WPA2-Personal"), Security::WPA2);
    EXPECT_EQ(parseSecurity("RSN"), Security::WPA2);
    EXPECT_EQ(parseSecurity("WPA1"), Security::WPA);
    EXPECT_EQ(parseSecurity("WEP"), Security::WEP);
    EXPECT_EQ(parseSecurity("--"), Security::Open);
    EXPECT_EQ(parseSecurity(""), Security::Open);
    EXPECT_EQ(parseSecurity("Open"), Security::Open);
    EXPECT_EQ(parseSecurity("Aberta"), Security::Open);
    EXPECT_EQ(parseSecurity("802.1X"), Security::Unknown);
}

TEST(NmcliParserTest, ParsesTerseOutputWithEscapedColons) {
    const std::string output =
        "HomeNet:AA\\:BB\\:CC\\:DD\\:EE\\:01:6:78:WPA2\n"
        "Cafe:AA\\:BB\\:CC\\:DD\\:EE\\:02:149:40:--\n";

    std::vector<WirelessNetwork> networks = NmcliParser().parse(output);

    ASSERT_EQ(networks.size(), 2u);
    EXPECT_EQ(networks[0].ssid, "HomeNet");
    EXPECT_EQ(networks[0].bssid, "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(networks[0].channel, 6);
    EXPECT_EQ(networks[0].signalPercent, 78);
    EXPECT_EQ(networks[0].security, Security::WPA2);
    EXPECT_EQ(networks[1].channel, 149);
    EXPECT_EQ(networks[1].security, Security::Open);
}

TEST(NmcliParserTest, SkipsMalformedAndHiddenLines) {
    const std::string output =
        "Good:AA\\:BB\\:CC\\:DD\\:EE\\:01:11:55:WPA3\n"
        "garbage without separators\n"
        "Bad:not-a-mac:1:50:WPA2\n"
        "NoSignal:AA\\:BB\\:CC\\:DD\\:EE\\:03:1:strong:WPA2\n"
        ":AA\\:BB\\:CC\\:DD\\:EE\\:04:1:50:WPA2\n"
        "\n";

    std::vector<WirelessNetwork> networks = NmcliParser().parse(output);

    ASSERT_EQ(networks.size(), 1u);
    EXPECT_EQ(networks[0].ssid, "Good");
    EXPECT_EQ(networks[0].security, Security::WPA3);
}

TEST(NmcliParserTest, MissingOptionalFieldsDefault) {
    std::vector<WirelessNetwork> networks =
        NmcliParser().parse("Lab:AA\\:BB\\:CC\\:DD\\:EE\\:05::60\n");

    ASSERT_EQ(networks.size(), 1u);
    EXPECT_EQ(networks[0].channel, 0);
    EXPECT_EQ(networks[0].security, Security::Unknown);
}

TEST(IwlistParserTest, ParsesCells) {
    const std::string output =
        "wlan0     Scan completed :\n"
        "          Cell 01 - Address: 00:11:22:33:44:55\n"
        "                    Channel:6\n"
        "                    Frequency:2.437 GHz (Channel 6)\n"
        "                    Quality=70/70  Signal level=-40 dBm\n"
        "                    Encryption key:on\n"
        "                    ESSID:\"Office\"\n"
        "                    IE: IEEE 802.11i/WPA2 Version 1\n"
        "          Cell 02 - Address: 66:77:88:99:AA:BB\n"
        "                    Frequency:5.18 GHz (Channel 36)\n"
        "                    Quality=30/70  Signal level=-80 dBm\n"
        "                    Encryption key:off\n"
        "                    ESSID:\"Cafe Guest\"\n";

    std::vector<WirelessNetwork> networks = IwlistParser().parse(output);

    ASSERT_EQ(networks.size(), 2u);
    EXPECT_EQ(networks[0].ssid, "Office");
    EXPECT_EQ(networks[0].bssid, "00:11:22:33:44:55");
    EXPECT_EQ(networks[0].signalPercent, 100);
    EXPECT_EQ(*networks[0].rssiDbm, -40);
    EXPECT_EQ(networks[0].channel, 6);
    EXPECT_EQ(*networks[0].frequencyMhz, 2437u);
    EXPECT_EQ(networks[0].security, Security::WPA2);

    EXPECT_EQ(networks[1].ssid, "Cafe Guest");
    EXPECT_EQ(networks[1].signalPercent, 40);
    EXPECT_EQ(networks[1].channel, 36);
    EXPECT_EQ(networks[1].security, Security::Open);
}

TEST(IwlistParserTest, SkipsCellWithoutSignal) {
    const std::string output =
        "          Cell 01 - Address: 00:11:22:33:44:55\n"
        "                    ESSID:\"NoSignal\"\n"
        "          Cell 02 - Address: 00:11:22:33:44:66\n"
        "                    Quality=35/70  Signal level=50/100\n"
        "                    ESSID:\"Relative\"\n";

    std::vector<WirelessNetwork> networks = IwlistParser().parse(output);

    ASSERT_EQ(networks.size(), 1u);
    EXPECT_EQ(networks[0].ssid, "Relative");
    EXPECT_EQ(networks[0].signalPercent, 50);
    EXPECT_EQ(networks[0].security, Security::Unknown);
}

TEST(AirportParserTest, AnchorsOnBssidColumn) {
    const std::string output =
        "                            SSID BSSID             RSSI CHANNEL HT CC SECURITY (auth/unicast/group)\n"
        "                        Home Net 00:11:22:33:44:55 -55  11      Y  US WPA2(PSK/AES/AES)\n"
        "                           Guest aa:bb:cc:dd:ee:ff -70  149,+1  Y  US NONE\n"
        "                          Broken 00:11:22:33:44:77 n/a\n";

    std::vector<WirelessNetwork> networks = AirportParser().parse(output);

    ASSERT_EQ(networks.size(), 2u);
    EXPECT_EQ(networks[0].ssid, "Home Net");
    EXPECT_EQ(*networks[0].rssiDbm, -55);
    EXPECT_EQ(networks[0].signalPercent, 90);
    EXPECT_EQ(networks[0].channel, 11);
    EXPECT_EQ(networks[0].security, Security::WPA2);
    EXPECT_EQ(networks[1].ssid, "Guest");
    EXPECT_EQ(networks[1].channel, 149);
    EXPECT_EQ(networks[1].security, Security::Open);
}

TEST(NetshParserTest, OneSsidWithSeveralBssids) {
    const std::string output =
        "Interface name : Wi-Fi\r\n"
        "There are 1 networks currently visible.\r\n"
        "\r\n"
        "SSID 1 : Corp\r\n"
        "    Network type            : Infrastructure\r\n"
        "    Authentication          : WPA2-Personal\r\n"
        "    Encryption              : CCMP\r\n"
        "    BSSID 1                 : 00:11:22:33:44:55\r\n"
        "         Signal             : 90%\r\n"
        "         Radio type         : 802.11n\r\n"
        "         Channel            : 6\r\n"
        "    BSSID 2                 : 00:11:22:33:44:66\r\n"
        "         Signal             : 40%\r\n"
        "         Channel            : 11\r\n"
        "SSID 2 : Loja\r\n"
        "    Autenticação            : Aberta\r\n"
        "    BSSID 1                 : 00:11:22:33:44:77\r\n"
        "         Sinal              : 65%\r\n"
        "         Canal              : 1\r\n";

    std::vector<WirelessNetwork> networks = NetshParser().parse(output);

    ASSERT_EQ(networks.size(), 3u);
    EXPECT_EQ(networks[0].ssid, "Corp");
    EXPECT_EQ(networks[0].signalPercent, 90);
    EXPECT_EQ(networks[0].channel, 6);
    EXPECT_EQ(networks[0].security, Security::WPA2);
    EXPECT_EQ(networks[1].ssid, "Corp");
    EXPECT_EQ(networks[1].bssid, "00:11:22:33:44:66");
    EXPECT_EQ(networks[1].channel, 11);
    EXPECT_EQ(networks[2].ssid, "Loja");
    EXPECT_EQ(networks[2].signalPercent, 65);
    EXPECT_EQ(networks[2].security, Security::Open);
}

TEST(PlatformParsersTest, LinuxTriesNmcliThenIwlist) {
    std::vector<std::unique_ptr<WirelessOutputParser>> parsers = makePlatformParsers();
#if defined(__linux__)
    ASSERT_EQ(parsers.size(), 2u);
    EXPECT_STREQ(parsers[0]->name(), "nmcli");
    EXPECT_STREQ(parsers[1]->name(), "iwlist");
#else
    EXPECT_FALSE(parsers.empty());
#endif
}

} // namespace test
} // namespace netwatch
