#ifndef SSDP_JSON_EXPORT_HPP
#define SSDP_JSON_EXPORT_HPP

#include <nlohmann/json.hpp>

#include "ssdp_discovery.hpp"
#include "upnp_device.hpp"

using nlohmann::json;

namespace discovery
{

void to_json(json& j, const endpoint& ep);

void to_json(json& j, const search_response& res);

} // namespace discovery

namespace upnp
{

void to_json(json& j, const spec_version& version);

void to_json(json& j, const icon& ic);

void to_json(json& j, const device_description& desc);

} // namespace upnp

#endif
