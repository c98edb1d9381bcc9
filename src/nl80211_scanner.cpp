#include "netwatch/nl80211_scanner.hpp"

#include "netwatch/log.hpp"

#include <linux/nl80211.h>
#include <netlink/netlink.h>
#include <netlink/genl/genl.h>
#include <netlink/genl/ctrl.h>
#include <net/if.h>

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

namespace netwatch {

namespace {

struct SocketDeleter {
    void operator()(struct nl_sock* sock) const { nl_socket_free(sock); }
};
struct MessageDeleter {
    void operator()(struct nl_msg* msg) const { nlmsg_free(msg); }
};
struct CallbackDeleter {
    void operator()(struct nl_cb* cb) const { nl_cb_put(cb); }
};

using SocketPtr = std::unique_ptr<struct nl_sock, SocketDeleter>;
using MessagePtr = std::unique_ptr<struct nl_msg, MessageDeleter>;
using CallbackPtr = std::unique_ptr<struct nl_cb, CallbackDeleter>;

const uint8_t kIeSsid = 0;
const uint8_t kIeRsn = 48;
const uint8_t kIeVendor = 221;
const uint16_t kCapabilityPrivacy = 1 << 4;

struct ScanData {
    std::vector<WirelessNetwork>* networks;
};

std::string format_mac(const uint8_t* mac) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 6; i++) {
        if (i > 0) oss << ":";
        oss << std::setw(2) << static_cast<int>(mac[i]);
    }
    return oss.str();
}

// True when the RSN element advertises SAE (WPA3-Personal).
bool rsn_has_sae(const uint8_t* rsn, int len) {
    int pos = 2 + 4;   // version, group cipher
    if (pos + 2 > len) return false;
    int pairwise = rsn[pos] | (rsn[pos + 1] << 8);
    pos += 2 + 4 * pairwise;
    if (pos + 2 > len) return false;
    int akm_count = rsn[pos] | (rsn[pos + 1] << 8);
    pos += 2;
    for (int i = 0; i < akm_count && pos + 4 <= len; ++i, pos += 4) {
        if (rsn[pos] == 0x00 && rsn[pos + 1] == 0x0f && rsn[pos + 2] == 0xac &&
            (rsn[pos + 3] == 8 || rsn[pos + 3] == 24)) {
            return true;
        }
    }
    return false;
}

std::string ssid_from_ies(const uint8_t* ie, int ielen) {
    for (int i = 0; i + 1 < ielen; ) {
        uint8_t id = ie[i];
        uint8_t len = ie[i + 1];
        if (i + 2 + len > ielen) break;
        if (id == kIeSsid) {
            return len > 0 && len <= 32 ? std::string(reinterpret_cast<const char*>(&ie[i + 2]), len)
                                        : std::string();
        }
        i += 2 + len;
    }
    return std::string();
}

int scan_result_handler(struct nl_msg* msg, void* arg) {
    ScanData* data = static_cast<ScanData*>(arg);
    struct genlmsghdr* gnlh = static_cast<struct genlmsghdr*>(nlmsg_data(nlmsg_hdr(msg)));
    struct nlattr* tb[NL80211_ATTR_MAX + 1];
    struct nlattr* bss[NL80211_BSS_MAX + 1];

    nla_parse(tb, NL80211_ATTR_MAX, genlmsg_attrdata(gnlh, 0),
              genlmsg_attrlen(gnlh, 0), NULL);

    if (!tb[NL80211_ATTR_BSS]) {
        return NL_SKIP;
    }
    if (nla_parse_nested(bss, NL80211_BSS_MAX, tb[NL80211_ATTR_BSS], NULL)) {
        return NL_SKIP;
    }
    if (!bss[NL80211_BSS_BSSID] || !bss[NL80211_BSS_INFORMATION_ELEMENTS]) {
        return NL_SKIP;
    }

    WirelessNetwork network;
    network.bssid = format_mac(static_cast<uint8_t*>(nla_data(bss[NL80211_BSS_BSSID])));

    if (bss[NL80211_BSS_SIGNAL_MBM]) {
        int32_t mbm = static_cast<int32_t>(nla_get_u32(bss[NL80211_BSS_SIGNAL_MBM]));
        network.rssiDbm = mbm / 100;
        network.signalPercent = percentFromDbm(mbm / 100);
    } else if (bss[NL80211_BSS_SIGNAL_UNSPEC]) {
        network.signalPercent = nla_get_u8(bss[NL80211_BSS_SIGNAL_UNSPEC]);
    }

    if (bss[NL80211_BSS_FREQUENCY]) {
        network.frequencyMhz = nla_get_u32(bss[NL80211_BSS_FREQUENCY]);
        network.channel = channelFromFrequency(*network.frequencyMhz);
    }

    const uint8_t* ie = static_cast<const uint8_t*>(nla_data(bss[NL80211_BSS_INFORMATION_ELEMENTS]));
    int ielen = nla_len(bss[NL80211_BSS_INFORMATION_ELEMENTS]);
    network.ssid = ssid_from_ies(ie, ielen);

    bool privacy = false;
    if (bss[NL80211_BSS_CAPABILITY]) {
        privacy = (nla_get_u16(bss[NL80211_BSS_CAPABILITY]) & kCapabilityPrivacy) != 0;
    }
    network.security = Nl80211Backend::securityFromIes(ie, ielen, privacy);

    if (!network.ssid.empty()) {
        data->networks->push_back(network);
    }
    return NL_SKIP;
}

int finish_handler(struct nl_msg*, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = 0;
    return NL_SKIP;
}

int error_handler(struct sockaddr_nl*, struct nlmsgerr* err, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = err->error;
    return NL_STOP;
}

int ack_handler(struct nl_msg*, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = 0;
    return NL_STOP;
}

// Sends `msg` and pumps replies until the handlers settle the status.
// Returns 0 on success or a negative errno / libnl error.
int send_and_wait(struct nl_sock* sock, struct nl_msg* msg, struct nl_cb* cb, int& err) {
    err = 1;
    nl_cb_err(cb, NL_CB_CUSTOM, error_handler, &err);
    nl_cb_set(cb, NL_CB_FINISH, NL_CB_CUSTOM, finish_handler, &err);
    nl_cb_set(cb, NL_CB_ACK, NL_CB_CUSTOM, ack_handler, &err);

    int rc = nl_send_auto(sock, msg);
    if (rc < 0) {
        return rc;
    }
    while (err > 0) {
        rc = nl_recvmsgs(sock, cb);
        if (rc < 0) {
            return rc;
        }
    }
    return err;
}

} // namespace

Nl80211Backend::Nl80211Backend(InterfaceQuery& interfaces)
    : interfaces_(interfaces)
{
}

Nl80211Backend::~Nl80211Backend() {}

Security Nl80211Backend::securityFromIes(const uint8_t* ie, int ielen, bool privacy) {
    bool has_rsn = false;
    bool has_sae = false;
    bool has_wpa = false;

    for (int i = 0; i + 1 < ielen; ) {
        uint8_t id = ie[i];
        uint8_t len = ie[i + 1];
        if (i + 2 + len > ielen) break;

        if (id == kIeRsn) {
            has_rsn = true;
            has_sae = rsn_has_sae(&ie[i + 2], len);
        } else if (id == kIeVendor && len >= 4) {
            if (memcmp(&ie[i + 2], "\x00\x50\xf2\x01", 4) == 0) {
                has_wpa = true;
            }
        }
        i += 2 + len;
    }

    if (has_sae) return Security::WPA3;
    if (has_rsn) return Security::WPA2;
    if (has_wpa) return Security::WPA;
    if (privacy) return Security::WEP;
    return Security::Open;
}

WirelessScanResult Nl80211Backend::scan(std::chrono::milliseconds timeout) {
    WirelessScanResult result;
    result.source = name();

    std::optional<std::string> interface = interfaces_.wirelessInterface();
    if (!interface) {
        result.message = "no wireless interface found";
        return result;
    }

    unsigned int if_index = if_nametoindex(interface->c_str());
    if (if_index == 0) {
        result.message = "wireless interface " + *interface + " not found";
        return result;
    }

    SocketPtr sock(nl_socket_alloc());
    if (!sock) {
        result.message = "failed to allocate netlink socket";
        return result;
    }
    if (genl_connect(sock.get()) < 0) {
        result.message = "failed to connect to generic netlink";
        return result;
    }

    int nl80211_id = genl_ctrl_resolve(sock.get(), "nl80211");
    if (nl80211_id < 0) {
        result.message = "nl80211 not found (kernel might be too old or WiFi not available)";
        return result;
    }
    NETWATCH_LOG_DEBUG("wireless", "using wireless interface: " << *interface);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    int err = 0;

    MessagePtr trigger(nlmsg_alloc());
    CallbackPtr trigger_cb(nl_cb_alloc(NL_CB_DEFAULT));
    if (!trigger || !trigger_cb) {
        result.message = "failed to allocate netlink message";
        return result;
    }
    genlmsg_put(trigger.get(), 0, 0, nl80211_id, 0, 0, NL80211_CMD_TRIGGER_SCAN, 0);
    nla_put_u32(trigger.get(), NL80211_ATTR_IFINDEX, if_index);

    int rc = send_and_wait(sock.get(), trigger.get(), trigger_cb.get(), err);
    bool triggered = rc == 0;
    if (!triggered) {
        NETWATCH_LOG_DEBUG("wireless", "scan trigger failed (" << rc
                           << "), reading cached scan results");
    }

    for (;;) {
        MessagePtr dump(nlmsg_alloc());
        CallbackPtr dump_cb(nl_cb_alloc(NL_CB_DEFAULT));
        if (!dump || !dump_cb) {
            result.message = "failed to allocate netlink message";
            return result;
        }
        genlmsg_put(dump.get(), 0, 0, nl80211_id, 0, NLM_F_DUMP, NL80211_CMD_GET_SCAN, 0);
        nla_put_u32(dump.get(), NL80211_ATTR_IFINDEX, if_index);

        std::vector<WirelessNetwork> networks;
        ScanData scan_data = {&networks};
        nl_cb_set(dump_cb.get(), NL_CB_VALID, NL_CB_CUSTOM, scan_result_handler, &scan_data);

        rc = send_and_wait(sock.get(), dump.get(), dump_cb.get(), err);
        if (rc < 0) {
            std::ostringstream oss;
            oss << "scan dump failed with error " << rc;
            result.message = oss.str();
            return result;
        }

        if (!networks.empty()) {
            result.networks = std::move(networks);
            result.status = WirelessScanStatus::Ok;
            return result;
        }
        if (!triggered || std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    if (!triggered) {
        result.message = "no cached scan results and no permission to trigger a scan";
        return result;
    }
    result.status = WirelessScanStatus::Ok;
    return result;
}

} // namespace netwatch
