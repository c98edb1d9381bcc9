#include "netwatch/system.hpp"

#include "netwatch/log.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace netwatch {

namespace {

bool has_prefix(const std::string& name, const char* prefix) {
    return name.compare(0, std::strlen(prefix), prefix) == 0;
}

bool is_wireless(const std::string& name) {
    if (has_prefix(name, "wlan") || has_prefix(name, "wlp") ||
        has_prefix(name, "wlo") || has_prefix(name, "wlx")) {
        return true;
    }
    struct stat st;
    std::string path = "/sys/class/net/" + name + "/wireless";
    return stat(path.c_str(), &st) == 0;
}

// First interface that is up, not loopback and carries IPv4.
std::optional<Ipv4Address> first_interface_address() {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        NETWATCH_LOG_WARN("interfaces", "getifaddrs failed: " << std::strerror(errno));
        return std::nullopt;
    }

    std::optional<Ipv4Address> found;
    for (struct ifaddrs* ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0) continue;
        uint32_t addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr;
        found = Ipv4Address(ntohl(addr));
        break;
    }
    freeifaddrs(ifaddr);
    return found;
}

} // namespace

SystemInterfaceQuery::SystemInterfaceQuery(std::string probeAddress)
    : probe_address_(std::move(probeAddress))
{
}

std::optional<Ipv4Address> SystemInterfaceQuery::localAddress() {
    // Connecting a UDP socket sends nothing but makes the kernel pick the
    // outbound source address.
    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd >= 0) {
        struct sockaddr_in remote;
        std::memset(&remote, 0, sizeof(remote));
        remote.sin_family = AF_INET;
        remote.sin_port = htons(80);

        std::optional<Ipv4Address> result;
        if (inet_pton(AF_INET, probe_address_.c_str(), &remote.sin_addr) == 1 &&
            connect(fd, reinterpret_cast<struct sockaddr*>(&remote), sizeof(remote)) == 0) {
            struct sockaddr_in local;
            socklen_t len = sizeof(local);
            if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&local), &len) == 0) {
                result = Ipv4Address(ntohl(local.sin_addr.s_addr));
            }
        }
        close(fd);
        if (result && result->value() != 0) {
            return result;
        }
    }

    NETWATCH_LOG_DEBUG("interfaces", "no route to " << probe_address_ << ", checking interfaces");
    return first_interface_address();
}

std::optional<std::string> SystemInterfaceQuery::wirelessInterface() {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        NETWATCH_LOG_WARN("interfaces", "getifaddrs failed: " << std::strerror(errno));
        return std::nullopt;
    }

    std::optional<std::string> found;
    for (struct ifaddrs* ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next) {
        std::string name(ifa->ifa_name);
        if (is_wireless(name)) {
            found = name;
            break;
        }
    }
    freeifaddrs(ifaddr);
    return found;
}

} // namespace netwatch
