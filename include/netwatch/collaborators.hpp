#ifndef NETWATCH_COLLABORATORS_HPP
#define NETWATCH_COLLABORATORS_HPP

#include "netwatch/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace netwatch {

enum class ProbeMethod { Arp, IcmpEcho, TcpConnect };

const char* toString(ProbeMethod method);

enum class ProbeStatus {
    Reachable,
    Unreachable,
    Timeout,
    Unavailable,   // capability missing or insufficient privilege
    Error
};

struct ProbeResult {
    ProbeStatus status = ProbeStatus::Unreachable;
    std::optional<double> roundTripMs;
    std::optional<std::string> physicalAddress;

    bool reachable() const noexcept { return status == ProbeStatus::Reachable; }
};

// One reachability/latency measurement against one address.
// Implementations must be safe to call from several threads at once.
class ProbeExecutor {
public:
    virtual ~ProbeExecutor() = default;

    virtual ProbeResult probe(const Ipv4Address& address, ProbeMethod method,
                              std::chrono::milliseconds timeout) = 0;
};

class HostnameResolver {
public:
    virtual ~HostnameResolver() = default;

    virtual std::optional<std::string> reverseLookup(const Ipv4Address& address,
                                                     std::chrono::milliseconds timeout) = 0;
    virtual std::optional<Ipv4Address> forwardLookup(const std::string& name,
                                                     std::chrono::milliseconds timeout) = 0;
};

class InterfaceQuery {
public:
    virtual ~InterfaceQuery() = default;

    // Local IPv4 address used for outbound traffic.
    virtual std::optional<Ipv4Address> localAddress() = 0;
    virtual std::optional<std::string> wirelessInterface() = 0;
};

struct CommandResult {
    bool launched = false;   // false when the executable could not be started
    bool timedOut = false;
    int exitCode = -1;
    std::string output;

    bool succeeded() const noexcept { return launched && !timedOut && exitCode == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout) = 0;
};

} // namespace netwatch

#endif
