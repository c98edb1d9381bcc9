#ifndef NETWATCH_SYSTEM_HPP
#define NETWATCH_SYSTEM_HPP

#include "netwatch/collaborators.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netwatch {

// posix_spawnp + pipe; the child is killed when the timeout expires.
// Children run with LC_ALL=C so their output is parseable.
class SystemCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv,
                      std::chrono::milliseconds timeout) override;
};

class SystemProbeExecutor : public ProbeExecutor {
public:
    explicit SystemProbeExecutor(CommandRunner& runner,
                                 std::vector<uint16_t> tcpPorts = {80, 443, 53, 22});

    ProbeResult probe(const Ipv4Address& address, ProbeMethod method,
                      std::chrono::milliseconds timeout) override;

private:
    ProbeResult arp_probe(const Ipv4Address& address, std::chrono::milliseconds timeout);
    ProbeResult icmp_probe(const Ipv4Address& address, std::chrono::milliseconds timeout);
    ProbeResult ping_command_probe(const Ipv4Address& address, std::chrono::milliseconds timeout);
    ProbeResult tcp_probe(const Ipv4Address& address, std::chrono::milliseconds timeout);

    CommandRunner& runner_;
    std::vector<uint16_t> tcp_ports_;
    std::atomic<uint16_t> next_sequence_{1};
    std::atomic<bool> icmp_socket_denied_{false};
};

// getnameinfo/getaddrinfo on a detached helper thread so a slow resolver
// cannot hold a caller past its timeout.
class SystemHostnameResolver : public HostnameResolver {
public:
    std::optional<std::string> reverseLookup(const Ipv4Address& address,
                                             std::chrono::milliseconds timeout) override;
    std::optional<Ipv4Address> forwardLookup(const std::string& name,
                                             std::chrono::milliseconds timeout) override;
};

class SystemInterfaceQuery : public InterfaceQuery {
public:
    explicit SystemInterfaceQuery(std::string probeAddress = "8.8.8.8");

    std::optional<Ipv4Address> localAddress() override;
    std::optional<std::string> wirelessInterface() override;

private:
    std::string probe_address_;
};

} // namespace netwatch

#endif
