#include <gtest/gtest.h>

#include "datagram_channel.hpp"
#include "ssdp_error.hpp"

#include <chrono>

using namespace discovery;
using namespace std::chrono;

// Fixed port for the loopback exchange, away from 1900 and the 9000 default
constexpr uint16_t LOOPBACK_PORT = 39517;

TEST(udp_channel, deadline_ends_receive_without_error)
{
    udp_channel channel {0};

    const auto start = steady_clock::now();
    std::optional<datagram> received = channel.receive(start + milliseconds {150});
    const auto elapsed = steady_clock::now() - start;

    EXPECT_FALSE(received.has_value());
    EXPECT_GE(elapsed, milliseconds {150});
    EXPECT_LT(elapsed, milliseconds {150 + 500});
}

TEST(udp_channel, past_deadline_returns_immediately)
{
    udp_channel channel {0};

    EXPECT_FALSE(channel.receive(steady_clock::now() - milliseconds {1}).has_value());
}

TEST(udp_channel, receives_datagram_with_sender_address)
{
    udp_channel receiver {LOOPBACK_PORT};
    udp_channel sender {0};
    const std::string payload {"HTTP/1.1 200 OK\r\nst: ssdp:all\r\n\r\n"};

    sender.send(endpoint {"127.0.0.1", LOOPBACK_PORT}, payload);
    std::optional<datagram> received = receiver.receive(steady_clock::now() + seconds {2});

    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->payload, payload);
    EXPECT_EQ(received->sender.addr, "127.0.0.1");
    EXPECT_NE(received->sender.port, 0);
}

TEST(udp_channel_factory, opens_bound_channels)
{
    udp_channel_factory factory;

    channel_ptr channel = factory.open(0);

    ASSERT_TRUE(channel);
    EXPECT_FALSE(channel->receive(steady_clock::now()).has_value());
}

TEST(udp_channel, failed_send_is_a_send_error)
{
    udp_channel channel {0};

    // The kernel refuses datagrams to port 0
    EXPECT_THROW(channel.send(endpoint {"127.0.0.1", 0}, "M-SEARCH * HTTP/1.1\r\n\r\n"), send_error);
}
