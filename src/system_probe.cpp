#include "netwatch/system.hpp"

#include "netwatch/log.hpp"
#include "system_probe_internal.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/ethernet.h>
#include <net/if.h>
#include <net/if_arp.h>
#include <netinet/if_ether.h>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <netpacket/packet.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace netwatch {

const char* toString(ProbeMethod method) {
    switch (method) {
        case ProbeMethod::Arp: return "ARP";
        case ProbeMethod::IcmpEcho: return "ICMP echo";
        case ProbeMethod::TcpConnect: return "TCP connect";
    }
    return "unknown";
}

namespace {

using Clock = std::chrono::steady_clock;

class Socket {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

private:
    int fd_;
};

bool permission_denied(int error) {
    return error == EPERM || error == EACCES;
}

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

std::string format_mac(const uint8_t* mac) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 6; i++) {
        if (i > 0) oss << ":";
        oss << std::setw(2) << static_cast<int>(mac[i]);
    }
    return oss.str();
}

struct LinkInfo {
    std::string name;
    int index = 0;
    uint32_t address = 0;   // network byte order
    uint8_t mac[6] = {0};
};

// Interface whose IPv4 subnet contains `target`.
bool find_link_for(const Ipv4Address& target, LinkInfo& link) {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        NETWATCH_LOG_DEBUG("probe", "getifaddrs failed: " << std::strerror(errno));
        return false;
    }

    bool found = false;
    for (struct ifaddrs* ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || !ifa->ifa_netmask || ifa->ifa_addr->sa_family != AF_INET) continue;
        if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0) continue;

        uint32_t addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr;
        uint32_t mask = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_netmask)->sin_addr.s_addr;
        if ((addr & mask) == (htonl(target.value()) & mask)) {
            link.name = ifa->ifa_name;
            link.address = addr;
            found = true;
            break;
        }
    }
    freeifaddrs(ifaddr);
    if (!found) {
        return false;
    }

    link.index = static_cast<int>(if_nametoindex(link.name.c_str()));
    Socket sock(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!sock.valid() || link.index == 0) {
        return false;
    }
    struct ifreq ifr;
    std::memset(&ifr, 0, sizeof(ifr));
    std::strncpy(ifr.ifr_name, link.name.c_str(), IFNAMSIZ - 1);
    if (ioctl(sock.get(), SIOCGIFHWADDR, &ifr) != 0) {
        return false;
    }
    std::memcpy(link.mac, ifr.ifr_hwaddr.sa_data, 6);
    return true;
}

} // namespace

namespace internal {

uint16_t icmpChecksum(const void* data, size_t length) {
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;
    for (size_t i = 0; i + 1 < length; i += 2) {
        sum += static_cast<uint32_t>(bytes[i] << 8 | bytes[i + 1]);
    }
    if (length % 2) {
        sum += static_cast<uint32_t>(bytes[length - 1] << 8);
    }
    while (sum >> 16) {
        sum = (sum & 0xffff) + (sum >> 16);
    }
    return htons(static_cast<uint16_t>(~sum));
}

std::optional<double> parsePingTime(const std::string& output) {
    size_t pos = output.find("time=");
    if (pos == std::string::npos) {
        pos = output.find("time<");
    }
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    const char* start = output.c_str() + pos + 5;
    char* end = nullptr;
    double value = std::strtod(start, &end);
    if (end == start) {
        return std::nullopt;
    }
    return value;
}

} // namespace internal

SystemProbeExecutor::SystemProbeExecutor(CommandRunner& runner, std::vector<uint16_t> tcpPorts)
    : runner_(runner)
    , tcp_ports_(std::move(tcpPorts))
{
}

ProbeResult SystemProbeExecutor::probe(const Ipv4Address& address, ProbeMethod method,
                                       std::chrono::milliseconds timeout) {
    switch (method) {
        case ProbeMethod::Arp: return arp_probe(address, timeout);
        case ProbeMethod::IcmpEcho: return icmp_probe(address, timeout);
        case ProbeMethod::TcpConnect: return tcp_probe(address, timeout);
    }
    ProbeResult unknown;
    unknown.status = ProbeStatus::Error;
    return unknown;
}

ProbeResult SystemProbeExecutor::arp_probe(const Ipv4Address& address,
                                           std::chrono::milliseconds timeout) {
    ProbeResult result;

    LinkInfo link;
    if (!find_link_for(address, link)) {
        // ARP only works on-link; let the caller fall back to another method.
        NETWATCH_LOG_DEBUG("probe", address.toString() << " is not on a directly attached network");
        result.status = ProbeStatus::Unavailable;
        return result;
    }

    Socket sock(socket(AF_PACKET, SOCK_DGRAM | SOCK_CLOEXEC, htons(ETH_P_ARP)));
    if (!sock.valid()) {
        int error = errno;
        if (permission_denied(error)) {
            result.status = ProbeStatus::Unavailable;
        } else {
            NETWATCH_LOG_DEBUG("probe", "ARP socket failed: " << std::strerror(error));
            result.status = ProbeStatus::Error;
        }
        return result;
    }

    struct ether_arp request;
    std::memset(&request, 0, sizeof(request));
    request.arp_hrd = htons(ARPHRD_ETHER);
    request.arp_pro = htons(ETH_P_IP);
    request.arp_hln = ETH_ALEN;
    request.arp_pln = 4;
    request.arp_op = htons(ARPOP_REQUEST);
    std::memcpy(request.arp_sha, link.mac, ETH_ALEN);
    std::memcpy(request.arp_spa, &link.address, 4);
    uint32_t target = htonl(address.value());
    std::memcpy(request.arp_tpa, &target, 4);

    struct sockaddr_ll destination;
    std::memset(&destination, 0, sizeof(destination));
    destination.sll_family = AF_PACKET;
    destination.sll_protocol = htons(ETH_P_ARP);
    destination.sll_ifindex = link.index;
    destination.sll_halen = ETH_ALEN;
    std::memset(destination.sll_addr, 0xff, ETH_ALEN);

    auto started = Clock::now();
    auto deadline = started + timeout;
    if (sendto(sock.get(), &request, sizeof(request), 0,
               reinterpret_cast<struct sockaddr*>(&destination), sizeof(destination)) < 0) {
        int error = errno;
        result.status = permission_denied(error) ? ProbeStatus::Unavailable : ProbeStatus::Error;
        return result;
    }

    for (;;) {
        int wait = remaining_ms(deadline);
        if (wait == 0) {
            result.status = ProbeStatus::Timeout;
            return result;
        }
        struct pollfd pfd = {sock.get(), POLLIN, 0};
        int ready = poll(&pfd, 1, wait);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) {
            result.status = ready == 0 ? ProbeStatus::Timeout : ProbeStatus::Error;
            return result;
        }

        struct ether_arp reply;
        ssize_t n = recv(sock.get(), &reply, sizeof(reply), 0);
        if (n < static_cast<ssize_t>(sizeof(reply))) {
            continue;
        }
        if (ntohs(reply.arp_op) == ARPOP_REPLY && std::memcmp(reply.arp_spa, &target, 4) == 0) {
            result.status = ProbeStatus::Reachable;
            result.roundTripMs = elapsed_ms(started);
            result.physicalAddress = format_mac(reply.arp_sha);
            return result;
        }
    }
}

ProbeResult SystemProbeExecutor::icmp_probe(const Ipv4Address& address,
                                            std::chrono::milliseconds timeout) {
    if (icmp_socket_denied_.load()) {
        return ping_command_probe(address, timeout);
    }

    ProbeResult result;
    Socket sock(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP));
    if (!sock.valid()) {
        int error = errno;
        if (permission_denied(error)) {
            if (!icmp_socket_denied_.exchange(true)) {
                NETWATCH_LOG_INFO("probe", "unprivileged ICMP sockets not permitted, using the ping command");
            }
            return ping_command_probe(address, timeout);
        }
        NETWATCH_LOG_DEBUG("probe", "ICMP socket failed: " << std::strerror(error));
        result.status = ProbeStatus::Error;
        return result;
    }

    uint16_t sequence = next_sequence_.fetch_add(1);
    struct icmphdr request;
    std::memset(&request, 0, sizeof(request));
    request.type = ICMP_ECHO;
    request.un.echo.sequence = htons(sequence);
    request.checksum = internal::icmpChecksum(&request, sizeof(request));

    struct sockaddr_in destination;
    std::memset(&destination, 0, sizeof(destination));
    destination.sin_family = AF_INET;
    destination.sin_addr.s_addr = htonl(address.value());

    auto started = Clock::now();
    auto deadline = started + timeout;
    if (sendto(sock.get(), &request, sizeof(request), 0,
               reinterpret_cast<struct sockaddr*>(&destination), sizeof(destination)) < 0) {
        int error = errno;
        // EHOSTUNREACH/ENETUNREACH are ordinary "no route" answers.
        result.status = (error == EHOSTUNREACH || error == ENETUNREACH) ? ProbeStatus::Unreachable
                                                                        : ProbeStatus::Error;
        return result;
    }

    for (;;) {
        int wait = remaining_ms(deadline);
        if (wait == 0) {
            result.status = ProbeStatus::Timeout;
            return result;
        }
        struct pollfd pfd = {sock.get(), POLLIN, 0};
        int ready = poll(&pfd, 1, wait);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) {
            result.status = ready == 0 ? ProbeStatus::Timeout : ProbeStatus::Error;
            return result;
        }

        struct icmphdr reply;
        struct sockaddr_in from;
        socklen_t from_len = sizeof(from);
        ssize_t n = recvfrom(sock.get(), &reply, sizeof(reply), 0,
                             reinterpret_cast<struct sockaddr*>(&from), &from_len);
        if (n < static_cast<ssize_t>(sizeof(reply))) {
            continue;
        }
        if (reply.type == ICMP_ECHOREPLY && ntohs(reply.un.echo.sequence) == sequence &&
            from.sin_addr.s_addr == destination.sin_addr.s_addr) {
            result.status = ProbeStatus::Reachable;
            result.roundTripMs = elapsed_ms(started);
            return result;
        }
    }
}

ProbeResult SystemProbeExecutor::ping_command_probe(const Ipv4Address& address,
                                                    std::chrono::milliseconds timeout) {
    ProbeResult result;
    long seconds = std::max(1L, static_cast<long>(std::ceil(timeout.count() / 1000.0)));

    CommandResult command = runner_.run(
        {"ping", "-c", "1", "-W", std::to_string(seconds), address.toString()},
        timeout + std::chrono::milliseconds(1000));
    if (!command.launched) {
        result.status = ProbeStatus::Unavailable;
        return result;
    }
    if (command.timedOut) {
        result.status = ProbeStatus::Timeout;
        return result;
    }
    if (command.exitCode != 0) {
        result.status = ProbeStatus::Unreachable;
        return result;
    }

    result.status = ProbeStatus::Reachable;
    result.roundTripMs = internal::parsePingTime(command.output);
    return result;
}

ProbeResult SystemProbeExecutor::tcp_probe(const Ipv4Address& address,
                                           std::chrono::milliseconds timeout) {
    ProbeResult result;
    auto started = Clock::now();
    auto deadline = started + timeout;

    std::vector<Socket> sockets;
    std::vector<struct pollfd> pending;
    for (uint16_t port : tcp_ports_) {
        Socket sock(socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
        if (!sock.valid()) {
            NETWATCH_LOG_DEBUG("probe", "TCP socket failed: " << std::strerror(errno));
            continue;
        }

        struct sockaddr_in destination;
        std::memset(&destination, 0, sizeof(destination));
        destination.sin_family = AF_INET;
        destination.sin_port = htons(port);
        destination.sin_addr.s_addr = htonl(address.value());

        int rc = connect(sock.get(), reinterpret_cast<struct sockaddr*>(&destination), sizeof(destination));
        if (rc == 0 || errno == ECONNREFUSED) {
            // Connected, or actively refused: either way the host answered.
            result.status = ProbeStatus::Reachable;
            result.roundTripMs = elapsed_ms(started);
            return result;
        }
        if (errno != EINPROGRESS) {
            continue;
        }
        pending.push_back({sock.get(), POLLOUT, 0});
        sockets.push_back(std::move(sock));
    }

    if (pending.empty()) {
        result.status = ProbeStatus::Unreachable;
        return result;
    }

    while (!pending.empty()) {
        int wait = remaining_ms(deadline);
        if (wait == 0) {
            result.status = ProbeStatus::Timeout;
            return result;
        }
        int ready = poll(pending.data(), pending.size(), wait);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) {
            result.status = ready == 0 ? ProbeStatus::Timeout : ProbeStatus::Error;
            return result;
        }

        for (size_t i = 0; i < pending.size(); ) {
            if (pending[i].revents == 0) {
                ++i;
                continue;
            }
            int error = 0;
            socklen_t len = sizeof(error);
            if (getsockopt(pending[i].fd, SOL_SOCKET, SO_ERROR, &error, &len) == 0 &&
                (error == 0 || error == ECONNREFUSED)) {
                result.status = ProbeStatus::Reachable;
                result.roundTripMs = elapsed_ms(started);
                return result;
            }
            pending.erase(pending.begin() + static_cast<long>(i));
        }
    }

    result.status = ProbeStatus::Unreachable;
    return result;
}

} // namespace netwatch
