#ifndef NETWATCH_WIRELESS_PARSERS_HPP
#define NETWATCH_WIRELESS_PARSERS_HPP

#include "netwatch/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace netwatch {

// Turns the text output of one platform's wireless enumeration command
// into records. Malformed blocks are skipped, never fatal.
class WirelessOutputParser {
public:
    virtual ~WirelessOutputParser() = default;

    virtual const char* name() const = 0;
    virtual std::vector<std::string> command() const = 0;
    virtual std::vector<WirelessNetwork> parse(const std::string& rawOutput) const = 0;
};

// nmcli -t -f SSID,BSSID,CHAN,SIGNAL,SECURITY dev wifi
class NmcliParser : public WirelessOutputParser {
public:
    const char* name() const override { return "nmcli"; }
    std::vector<std::string> command() const override;
    std::vector<WirelessNetwork> parse(const std::string& rawOutput) const override;
};

// iwlist scanning
class IwlistParser : public WirelessOutputParser {
public:
    const char* name() const override { return "iwlist"; }
    std::vector<std::string> command() const override;
    std::vector<WirelessNetwork> parse(const std::string& rawOutput) const override;
};

// macOS airport -s
class AirportParser : public WirelessOutputParser {
public:
    const char* name() const override { return "airport"; }
    std::vector<std::string> command() const override;
    std::vector<WirelessNetwork> parse(const std::string& rawOutput) const override;
};

// netsh wlan show networks mode=bssid (English and Portuguese labels)
class NetshParser : public WirelessOutputParser {
public:
    const char* name() const override { return "netsh"; }
    std::vector<std::string> command() const override;
    std::vector<WirelessNetwork> parse(const std::string& rawOutput) const override;
};

// Parsers for the platform this binary was built for, in preference order.
std::vector<std::unique_ptr<WirelessOutputParser>> makePlatformParsers();

// Maps free-form security text to the enum; empty/"--"/"none" is Open.
Security parseSecurity(const std::string& text);

} // namespace netwatch

#endif
