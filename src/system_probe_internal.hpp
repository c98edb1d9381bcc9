#ifndef NETWATCH_SYSTEM_PROBE_INTERNAL_HPP
#define NETWATCH_SYSTEM_PROBE_INTERNAL_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace netwatch {
namespace internal {

// RFC 1071 ones'-complement checksum, returned in network byte order.
uint16_t icmpChecksum(const void* data, size_t length);

// Round trip from ping output: "time=12.3 ms" or "time<1ms".
std::optional<double> parsePingTime(const std::string& output);

} // namespace internal
} // namespace netwatch

#endif
