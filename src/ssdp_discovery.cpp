#include "ssdp_discovery.hpp"

#include "http/request.hpp"
#include "http/response.hpp"
#include "utils.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace discovery
{

search_request build_search_request(const config& cfg, std::string_view st)
{
    search_request req;

    try {
        req.destination = endpoint {utils::resolve_ipv4(cfg.broadcast_address), cfg.port};
    } catch(const std::runtime_error& err) {
        throw address_resolution_error {err.what()};
    }

    http::request msearch {"M-SEARCH", "*"};
    msearch.set_header("Host", req.destination.to_string());
    msearch.set_header("User-Agent", "");
    msearch.set_header("st", std::string {st});
    msearch.set_header("man", "\"ssdp:discover\"");
    msearch.set_header("mx", std::to_string(cfg.mx_seconds()));

    try {
        req.bytes = msearch.to_string();
    } catch(const std::invalid_argument& err) {
        throw serialization_error {fmt::format("Unable to serialize search request for '{}': {}", st, err.what())};
    }

    return req;
}

search_response parse_search_response(std::string_view payload, const endpoint& sender)
{
    http::response res;
    try {
        res.parse(payload);
    } catch(const std::invalid_argument& err) {
        throw parse_error {fmt::format("Malformed response from {}: {}", sender.to_string(), err.what())};
    }

    search_response parsed;
    parsed.cache_control = res.get_header("cache-control");
    parsed.server = res.get_header("server");
    parsed.st = res.get_header("st");
    parsed.ext = res.get_header("ext");
    parsed.usn = res.get_header("usn");
    parsed.response_addr = sender;

    if(std::string location = res.get_header("location"); !location.empty())
    {
        try {
            parsed.location = http::url::parse(location);
        } catch(const std::invalid_argument& err) {
            throw parse_error {fmt::format("Invalid location '{}' from {}: {}", location, sender.to_string(), err.what())};
        }
    }

    if(std::string date = res.get_header("date"); !date.empty())
    {
        try {
            parsed.date = http::parse_date(date);
        } catch(const std::invalid_argument& err) {
            throw parse_error {fmt::format("Invalid date '{}' from {}: {}", date, sender.to_string(), err.what())};
        }
    }

    return parsed;
}

std::vector<http::url> unique_locations(const std::vector<search_response>& responses)
{
    // Only a handful of devices answer, so searching a vector is enough and keeps the first-seen order
    std::vector<http::url> locations;
    for(const auto& response : responses)
    {
        if(!response.location)
            continue;

        if(std::find(locations.begin(), locations.end(), *response.location) == locations.end())
            locations.push_back(*response.location);
    }
    return locations;
}

ssdp::ssdp()
    : ssdp {config {}}
{}

ssdp::ssdp(config cfg)
    : m_config {std::move(cfg)},
      m_channels {std::make_unique<udp_channel_factory>()},
      m_fetcher {std::make_unique<upnp::http_description_fetcher>(m_config.verbose)}
{}

ssdp::ssdp(config cfg, std::unique_ptr<channel_factory> channels, std::unique_ptr<upnp::description_fetcher> fetcher)
    : m_config {std::move(cfg)},
      m_channels {std::move(channels)},
      m_fetcher {std::move(fetcher)}
{
    if(!m_channels || !m_fetcher)
        throw std::invalid_argument {"ssdp requires a channel factory and a description fetcher"};
}

std::vector<search_response> ssdp::search(std::string_view st) const
{
    channel_ptr channel = m_channels->open(m_config.port);

    search_request req = build_search_request(m_config, st);
    if(m_config.verbose)
        fmt::print(stderr, "Sending search request to {}:\n{}", req.destination.to_string(), req.bytes);

    channel->send(req.destination, std::move(req.bytes));

    const auto deadline = std::chrono::steady_clock::now() + m_config.timeout;

    std::vector<search_response> responses;
    while(auto received = channel->receive(deadline))
    {
        if(m_config.verbose)
            fmt::print(stderr, "Response from {}:\n{}\n", received->sender.to_string(), received->payload);

        responses.push_back(parse_search_response(received->payload, received->sender));
    }

    return responses;
}

std::vector<upnp::device_description> ssdp::search_devices(std::string_view st) const
{
    const std::vector<http::url> locations = unique_locations(search(st));

    std::vector<upnp::device_description> devices;
    devices.reserve(locations.size());
    for(const auto& location : locations)
        devices.push_back(m_fetcher->fetch(location));

    return devices;
}

} // namespace discovery
