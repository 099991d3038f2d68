#ifndef SSDP_CONFIG_HPP
#define SSDP_CONFIG_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <utility>

namespace discovery
{

#define DISCOVERY_IP "239.235.255.250"
#define DISCOVERY_PORT 9000

/// Parameters of a discovery client. Setters can be chained and later calls override earlier ones:
///   config {}.with_port(1900).with_timeout(2000)
struct config
{
    uint16_t port = DISCOVERY_PORT;
    std::string broadcast_address = DISCOVERY_IP;
    std::chrono::milliseconds timeout {0};
    bool verbose = false;

    config& with_port(uint16_t p)
    {
        port = p;
        return *this;
    }

    config& with_broadcast(std::string addr)
    {
        broadcast_address = std::move(addr);
        return *this;
    }

    config& with_timeout(int timeout_ms)
    {
        timeout = std::chrono::milliseconds {timeout_ms};
        return *this;
    }

    config& with_verbose(bool v)
    {
        verbose = v;
        return *this;
    }

    /// Value of the mx header: the timeout in whole seconds
    long mx_seconds() const
    {
        return static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
    }
};

} // namespace discovery

#endif
