#include "upnp_device.hpp"

#include "http/client.hpp"
#include "ssdp_error.hpp"
#include "utils.hpp"

#include "fmt/format.h"
#include <rapidxml/rapidxml.hpp>

#include <charconv>
#include <stdexcept>

using namespace rapidxml;

namespace upnp
{

// A repeated element overwrites the earlier ones. The text is all character data and CDATA
// directly below the element, nested elements are skipped.
static std::string child_value(const xml_node<char>* parent, const char* name)
{
    if(parent == nullptr)
        return {};

    const xml_node<char>* node = parent->first_node(name);
    if(node == nullptr)
        return {};
    for(const xml_node<char>* next = node->next_sibling(name); next; next = next->next_sibling(name))
        node = next;

    std::string text;
    for(const xml_node<char>* part = node->first_node(); part; part = part->next_sibling())
    {
        if(part->type() == node_data || part->type() == node_cdata)
            text.append(part->value(), part->value_size());
    }
    return text;
}

static int child_int(const xml_node<char>* parent, const char* name)
{
    std::string text = child_value(parent, name);
    std::string_view view = utils::trim(text);
    if(view.empty())
        return 0;
    if(view.front() == '+')
        view.remove_prefix(1);

    int value = 0;
    auto res = std::from_chars(view.data(), view.data() + view.size(), value);
    if(view.empty() || res.ec != std::errc {} || res.ptr != view.data() + view.size())
        throw discovery::decode_error {fmt::format("<{}> is not an integer: '{}'", name, text)};

    return value;
}

device_description parse_device_description(std::string_view xml)
{
    // rapidxml parses in place and needs a zero terminated buffer
    std::vector<char> buffer {xml.begin(), xml.end()};
    buffer.push_back('\0');

    xml_document<char> doc;
    try {
        doc.parse<parse_validate_closing_tags>(buffer.data());
    } catch(const rapidxml::parse_error& err) {
        throw discovery::decode_error {fmt::format("Malformed device description: {}", err.what())};
    }

    const xml_node<char>* root = doc.first_node();
    if(root == nullptr)
        throw discovery::decode_error {"Device description has no root element"};

    device_description desc;

    const xml_node<char>* spec_node = root->first_node("specVersion");
    desc.spec.major_version = child_int(spec_node, "major");
    desc.spec.minor_version = child_int(spec_node, "minor");
    desc.url_base = child_value(root, "URLBase");

    const xml_node<char>* device_node = root->first_node("device");
    desc.device_type = child_value(device_node, "deviceType");
    desc.friendly_name = child_value(device_node, "friendlyName");
    desc.manufacturer = child_value(device_node, "manufacturer");
    desc.manufacturer_url = child_value(device_node, "manufacturerURL");
    desc.model_description = child_value(device_node, "modelDescription");
    desc.model_name = child_value(device_node, "modelName");
    desc.model_number = child_value(device_node, "modelNumber");
    desc.model_url = child_value(device_node, "modelURL");
    desc.serial_number = child_value(device_node, "serialNumber");
    desc.udn = child_value(device_node, "UDN");
    desc.upc = child_value(device_node, "UPC");
    desc.presentation_url = child_value(device_node, "presentationURL");

    const xml_node<char>* icon_root = device_node ? device_node->first_node("iconList") : nullptr;
    if(icon_root != nullptr)
    {
        for(const xml_node<char>* icon_node = icon_root->first_node("icon"); icon_node; icon_node = icon_node->next_sibling("icon"))
        {
            desc.icons.emplace_back(icon {
                child_value(icon_node, "mimetype"),
                child_int(icon_node, "width"),
                child_int(icon_node, "height"),
                child_int(icon_node, "depth"),
                child_value(icon_node, "url")
            });
        }
    }

    return desc;
}

device_description http_description_fetcher::fetch(const http::url& location) const
{
    if(m_verbose)
        fmt::print(stderr, "Fetching device description from {}\n", location.to_string());

    http::response res;
    try {
        res = http::get(location);
    } catch(const std::invalid_argument& err) {
        throw discovery::fetch_error {fmt::format("GET {} failed: {}", location.to_string(), err.what())};
    } catch(const std::runtime_error& err) {
        throw discovery::fetch_error {fmt::format("GET {} failed: {}", location.to_string(), err.what())};
    }

    if(m_verbose)
        fmt::print(stderr, "{} answered {} {} with {} bytes\n", location.to_string(), res.get_code(), res.get_phrase(), res.get_body().size());

    return parse_device_description(res.get_body());
}

} // namespace upnp
