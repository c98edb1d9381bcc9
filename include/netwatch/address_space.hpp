#ifndef NETWATCH_ADDRESS_SPACE_HPP
#define NETWATCH_ADDRESS_SPACE_HPP

#include "netwatch/collaborators.hpp"
#include "netwatch/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netwatch {

class Cidr {
public:
    Cidr() = default;
    Cidr(Ipv4Address network, int prefixLength);

    // Accepts "a.b.c.d/n" and a bare "a.b.c.d" (treated as /32). Host bits
    // are masked off. Throws ConfigurationError on malformed input.
    static Cidr parse(const std::string& text);
    static std::optional<Cidr> tryParse(const std::string& text);

    Ipv4Address networkAddress() const noexcept { return network_; }
    int prefixLength() const noexcept { return prefix_; }
    uint32_t mask() const noexcept;
    Ipv4Address broadcastAddress() const noexcept;
    bool contains(const Ipv4Address& address) const noexcept;

    // Number of usable host addresses (network and broadcast excluded
    // for prefixes up to /30).
    uint64_t hostCount() const noexcept;

    // Usable host addresses in ascending order, at most `limit` of them.
    std::vector<Ipv4Address> hosts(size_t limit) const;

    std::string toString() const;

    bool operator==(const Cidr& other) const noexcept {
        return network_ == other.network_ && prefix_ == other.prefix_;
    }
    bool operator!=(const Cidr& other) const noexcept { return !(*this == other); }

private:
    Ipv4Address network_;
    int prefix_ = 32;
};

class AddressSpaceEnumerator {
public:
    static constexpr const char* kFallbackRange = "192.168.1.0/24";

    explicit AddressSpaceEnumerator(InterfaceQuery& interfaces, int defaultPrefix = 24);

    // Explicit range wins when valid; otherwise derive the /24 around the
    // local outbound address, or the fixed fallback when that is unknown.
    Cidr resolveRange(const std::optional<std::string>& explicitRange);

    std::optional<Ipv4Address> localAddress();

private:
    InterfaceQuery& interfaces_;
    int default_prefix_;
};

} // namespace netwatch

#endif
