#ifndef SSDP_DISCOVERY_HPP
#define SSDP_DISCOVERY_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <optional>

#include "datagram_channel.hpp"
#include "http/date.hpp"
#include "http/url.hpp"
#include "search_target.hpp"
#include "ssdp_config.hpp"
#include "ssdp_error.hpp"
#include "upnp_device.hpp"

namespace discovery
{

/// Answer of one device to a search request
struct search_response
{
    std::string cache_control;
    std::string server;
    std::string st;
    std::string ext;
    std::string usn;
    std::optional<http::url> location;
    std::optional<http::time_point> date;
    endpoint response_addr;
};

struct search_request
{
    std::string bytes;
    endpoint destination;
};

/// Builds the M-SEARCH request for search target st and resolves where it has to be sent.
/// Throws address_resolution_error or serialization_error.
search_request build_search_request(const config& cfg, std::string_view st);

/// Parses one datagram received from sender. Throws parse_error.
search_response parse_search_response(std::string_view payload, const endpoint& sender);

/// Locations of the responses in order of first appearance, responses without a location are skipped
std::vector<http::url> unique_locations(const std::vector<search_response>& responses);

/// SSDP search client. Every call opens its own socket so one instance can be shared between threads.
class ssdp
{
public:

    ssdp();

    explicit ssdp(config cfg);

    ssdp(config cfg, std::unique_ptr<channel_factory> channels, std::unique_ptr<upnp::description_fetcher> fetcher);

    /// Sends a search request and collects all responses received until the configured timeout elapsed
    std::vector<search_response> search(std::string_view st) const;

    std::vector<search_response> search(search_target st) const
    {
        return search(to_string(st));
    }

    /// Searches and fetches the description of every distinct location found.
    /// Fails as a whole if any description can not be fetched or decoded.
    std::vector<upnp::device_description> search_devices(std::string_view st) const;

    std::vector<upnp::device_description> search_devices(search_target st) const
    {
        return search_devices(to_string(st));
    }

    const config& get_config() const
    {
        return m_config;
    }

private:

    config m_config;

    std::unique_ptr<channel_factory> m_channels;

    std::unique_ptr<upnp::description_fetcher> m_fetcher;

};

} // namespace discovery

#endif
