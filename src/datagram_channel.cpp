#include "datagram_channel.hpp"

#include "ssdp_error.hpp"

#include "fmt/format.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <poll.h>

namespace discovery
{

// Larger than any SSDP response seen in practice
constexpr size_t MAX_DATAGRAM_SIZE = 4096;

udp_channel::udp_channel(uint16_t port)
{
    try {
        m_sock = std::make_unique<net::udp_socket<net::ip_version::v4>>("0.0.0.0", port);
    } catch(const std::runtime_error& err) {
        throw bind_error {fmt::format("Unable to listen on 0.0.0.0:{}: {}", port, err.what())};
    }
}

void udp_channel::send(const endpoint& destination, std::string bytes)
{
    try {
        m_sock->send(destination.addr, destination.port, net::span {bytes.begin(), bytes.end()});
    } catch(const std::runtime_error& err) {
        throw send_error {fmt::format("Unable to send to {}: {}", destination.to_string(), err.what())};
    }
}

std::optional<datagram> udp_channel::receive(std::chrono::steady_clock::time_point deadline)
{
    using namespace std::chrono;

    while(true)
    {
        const auto now = steady_clock::now();
        if(now >= deadline)
            return std::nullopt;

        pollfd pfd {};
        pfd.fd = m_sock->get();
        pfd.events = POLLIN;

        const auto remaining = std::chrono::ceil<milliseconds>(deadline - now);
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if(ret < 0)
        {
            if(errno == EINTR)
                continue;
            throw receive_error {fmt::format("Waiting for responses failed: {}", std::strerror(errno))};
        }
        if(ret == 0)
            continue;
        if(pfd.revents & (POLLERR | POLLNVAL))
            throw receive_error {"Socket error while waiting for responses"};

        try {
            auto [buffer, peer] = m_sock->read<char>(MAX_DATAGRAM_SIZE);
            return datagram {std::string {buffer.data(), buffer.size()}, endpoint {peer.addr, peer.port}};
        } catch(const std::runtime_error& err) {
            throw receive_error {fmt::format("Unable to read response: {}", err.what())};
        }
    }
}

} // namespace discovery
