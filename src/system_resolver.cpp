#include "netwatch/system.hpp"

#include "netwatch/log.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstring>
#include <future>
#include <memory>
#include <system_error>
#include <thread>

namespace netwatch {

namespace {

// Runs `lookup` on a detached thread; the caller stops waiting at the
// timeout and the thread finishes on its own.
template <typename T, typename Lookup>
std::optional<T> with_timeout(Lookup lookup, std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<std::optional<T>>>();
    std::future<std::optional<T>> future = promise->get_future();

    try {
        std::thread([promise, lookup]() {
            promise->set_value(lookup());
        }).detach();
    } catch (const std::system_error& e) {
        NETWATCH_LOG_WARN("resolver", "could not start lookup thread: " << e.what());
        return std::nullopt;
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return future.get();
}

} // namespace

std::optional<std::string> SystemHostnameResolver::reverseLookup(const Ipv4Address& address,
                                                                 std::chrono::milliseconds timeout) {
    uint32_t value = address.value();
    return with_timeout<std::string>([value]() -> std::optional<std::string> {
        struct sockaddr_in sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = htonl(value);

        char host[NI_MAXHOST];
        int rc = getnameinfo(reinterpret_cast<struct sockaddr*>(&sa), sizeof(sa),
                             host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0) {
            return std::nullopt;
        }
        return std::string(host);
    }, timeout);
}

std::optional<Ipv4Address> SystemHostnameResolver::forwardLookup(const std::string& name,
                                                                 std::chrono::milliseconds timeout) {
    return with_timeout<Ipv4Address>([name]() -> std::optional<Ipv4Address> {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int rc = getaddrinfo(name.c_str(), nullptr, &hints, &res);
        if (rc != 0 || res == nullptr) {
            NETWATCH_LOG_DEBUG("resolver", "lookup of " << name << " failed: " << gai_strerror(rc));
            return std::nullopt;
        }
        uint32_t value = ntohl(reinterpret_cast<struct sockaddr_in*>(res->ai_addr)->sin_addr.s_addr);
        freeaddrinfo(res);
        return Ipv4Address(value);
    }, timeout);
}

} // namespace netwatch
