#ifndef SSDP_DATAGRAM_CHANNEL_HPP
#define SSDP_DATAGRAM_CHANNEL_HPP

#include <string>
#include <string_view>
#include <chrono>
#include <memory>
#include <optional>
#include <cstdint>

#include "socketwrapper.hpp"

namespace discovery
{

struct endpoint
{
    std::string addr;
    uint16_t port = 0;

    std::string to_string() const
    {
        return addr + ":" + std::to_string(port);
    }

    bool operator==(const endpoint& other) const
    {
        return addr == other.addr && port == other.port;
    }
};

struct datagram
{
    std::string payload;
    endpoint sender;
};

/// Socket used for one discovery round
class datagram_channel
{
public:

    virtual ~datagram_channel() = default;

    /// Sends the bytes as a single datagram. Throws send_error.
    virtual void send(const endpoint& destination, std::string bytes) = 0;

    /// Blocks until a datagram arrives or the deadline is reached.
    /// Returns std::nullopt once the deadline is reached, any other failure throws receive_error.
    virtual std::optional<datagram> receive(std::chrono::steady_clock::time_point deadline) = 0;
};

using channel_ptr = std::unique_ptr<datagram_channel>;

class channel_factory
{
public:

    virtual ~channel_factory() = default;

    /// Opens a channel listening on 0.0.0.0:port. Throws bind_error.
    virtual channel_ptr open(uint16_t port) const = 0;
};

class udp_channel : public datagram_channel
{
public:

    udp_channel(const udp_channel&) = delete;
    udp_channel& operator=(const udp_channel&) = delete;

    explicit udp_channel(uint16_t port);

    void send(const endpoint& destination, std::string bytes) override;

    std::optional<datagram> receive(std::chrono::steady_clock::time_point deadline) override;

private:

    std::unique_ptr<net::udp_socket<net::ip_version::v4>> m_sock;

};

class udp_channel_factory : public channel_factory
{
public:

    channel_ptr open(uint16_t port) const override
    {
        return std::make_unique<udp_channel>(port);
    }
};

} // namespace discovery

#endif
