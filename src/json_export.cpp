#include "json_export.hpp"

namespace discovery
{

void to_json(json& j, const endpoint& ep)
{
    j = json {{"address", ep.addr}, {"port", ep.port}};
}

void to_json(json& j, const search_response& res)
{
    j = json {
        {"cache_control", res.cache_control},
        {"server", res.server},
        {"st", res.st},
        {"ext", res.ext},
        {"usn", res.usn},
        {"location", res.location ? json(res.location->to_string()) : json(nullptr)},
        {"date", res.date ? json(http::format_date(*res.date)) : json(nullptr)},
        {"response_addr", res.response_addr}
    };
}

} // namespace discovery

namespace upnp
{

void to_json(json& j, const spec_version& version)
{
    j = json {{"major", version.major_version}, {"minor", version.minor_version}};
}

void to_json(json& j, const icon& ic)
{
    j = json {
        {"mimetype", ic.mime_type},
        {"width", ic.width},
        {"height", ic.height},
        {"depth", ic.depth},
        {"url", ic.url}
    };
}

void to_json(json& j, const device_description& desc)
{
    j = json {
        {"specVersion", desc.spec},
        {"URLBase", desc.url_base},
        {"deviceType", desc.device_type},
        {"friendlyName", desc.friendly_name},
        {"manufacturer", desc.manufacturer},
        {"manufacturerURL", desc.manufacturer_url},
        {"modelDescription", desc.model_description},
        {"modelName", desc.model_name},
        {"modelNumber", desc.model_number},
        {"modelURL", desc.model_url},
        {"serialNumber", desc.serial_number},
        {"UDN", desc.udn},
        {"UPC", desc.upc},
        {"presentationURL", desc.presentation_url},
        {"icons", desc.icons}
    };
}

} // namespace upnp
