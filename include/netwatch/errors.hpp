#ifndef NETWATCH_ERRORS_HPP
#define NETWATCH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace netwatch {

// Raised for malformed ranges, hosts or option values before any probing starts.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace netwatch

#endif
