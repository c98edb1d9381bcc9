#ifndef NETWATCH_NL80211_SCANNER_HPP
#define NETWATCH_NL80211_SCANNER_HPP

#include "netwatch/collaborators.hpp"
#include "netwatch/wireless_collector.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace netwatch {

// Reads BSS entries from the kernel through nl80211 generic netlink.
// Triggering a fresh scan needs CAP_NET_ADMIN; without it the cached
// results of the last system scan are dumped instead.
class Nl80211Backend : public WirelessBackend {
public:
    explicit Nl80211Backend(InterfaceQuery& interfaces);
    ~Nl80211Backend() override;

    const char* name() const override { return "nl80211"; }
    WirelessScanResult scan(std::chrono::milliseconds timeout) override;

    // Security from the IE list and the privacy capability bit.
    static Security securityFromIes(const uint8_t* ies, int length, bool privacy);

private:
    InterfaceQuery& interfaces_;
};

} // namespace netwatch

#endif
