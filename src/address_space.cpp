#include "netwatch/address_space.hpp"

#include "netwatch/errors.hpp"
#include "netwatch/log.hpp"

#include <cctype>
#include <sstream>

namespace netwatch {

namespace {

uint32_t prefix_mask(int prefix) {
    if (prefix <= 0) return 0;
    return prefix >= 32 ? 0xffffffffu : ~((1u << (32 - prefix)) - 1u);
}

bool all_digits(const std::string& text) {
    if (text.empty() || text.size() > 2) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

Cidr::Cidr(Ipv4Address network, int prefixLength)
    : network_(Ipv4Address(network.value() & prefix_mask(prefixLength)))
    , prefix_(prefixLength)
{
    if (prefixLength < 0 || prefixLength > 32) {
        throw ConfigurationError("prefix length must be between 0 and 32");
    }
}

std::optional<Cidr> Cidr::tryParse(const std::string& text) {
    std::string address_part = text;
    int prefix = 32;

    size_t slash = text.find('/');
    if (slash != std::string::npos) {
        address_part = text.substr(0, slash);
        std::string prefix_part = text.substr(slash + 1);
        if (!all_digits(prefix_part)) {
            return std::nullopt;
        }
        prefix = std::stoi(prefix_part);
        if (prefix > 32) {
            return std::nullopt;
        }
    }

    std::optional<Ipv4Address> address = Ipv4Address::parse(address_part);
    if (!address) {
        return std::nullopt;
    }
    return Cidr(*address, prefix);
}

Cidr Cidr::parse(const std::string& text) {
    std::optional<Cidr> cidr = tryParse(text);
    if (!cidr) {
        throw ConfigurationError("invalid network range: '" + text + "'");
    }
    return *cidr;
}

uint32_t Cidr::mask() const noexcept {
    return prefix_mask(prefix_);
}

Ipv4Address Cidr::broadcastAddress() const noexcept {
    return Ipv4Address(network_.value() | ~mask());
}

bool Cidr::contains(const Ipv4Address& address) const noexcept {
    return (address.value() & mask()) == network_.value();
}

uint64_t Cidr::hostCount() const noexcept {
    uint64_t total = uint64_t(1) << (32 - prefix_);
    return prefix_ <= 30 ? total - 2 : total;
}

std::vector<Ipv4Address> Cidr::hosts(size_t limit) const {
    std::vector<Ipv4Address> result;
    uint64_t count = hostCount();
    if (count > limit) {
        count = limit;
    }
    result.reserve(static_cast<size_t>(count));

    uint64_t first = network_.value();
    if (prefix_ <= 30) {
        first += 1;
    }
    for (uint64_t i = 0; i < count; ++i) {
        result.emplace_back(static_cast<uint32_t>(first + i));
    }
    return result;
}

std::string Cidr::toString() const {
    std::ostringstream oss;
    oss << network_.toString() << "/" << prefix_;
    return oss.str();
}

AddressSpaceEnumerator::AddressSpaceEnumerator(InterfaceQuery& interfaces, int defaultPrefix)
    : interfaces_(interfaces)
    , default_prefix_(defaultPrefix)
{
    if (default_prefix_ < 0 || default_prefix_ > 32) {
        throw ConfigurationError("default prefix must be between 0 and 32");
    }
}

Cidr AddressSpaceEnumerator::resolveRange(const std::optional<std::string>& explicitRange) {
    if (explicitRange) {
        Cidr range = Cidr::parse(*explicitRange);
        NETWATCH_LOG_DEBUG("address-space", "using explicit range " << range.toString());
        return range;
    }

    std::optional<Ipv4Address> local = localAddress();
    if (!local || (local->value() >> 24) == 127) {
        NETWATCH_LOG_WARN("address-space", "could not determine local address, falling back to "
                          << kFallbackRange);
        return Cidr::parse(kFallbackRange);
    }

    Cidr range(*local, default_prefix_);
    NETWATCH_LOG_INFO("address-space", "detected range " << range.toString()
                      << " from local address " << local->toString());
    return range;
}

std::optional<Ipv4Address> AddressSpaceEnumerator::localAddress() {
    return interfaces_.localAddress();
}

} // namespace netwatch
