#ifndef UPNP_DEVICE_HPP
#define UPNP_DEVICE_HPP

#include <string>
#include <string_view>
#include <vector>

#include "http/url.hpp"

namespace upnp
{

struct spec_version
{
    int major_version = 0;
    int minor_version = 0;
};

struct icon
{
    std::string mime_type;
    int width = 0;
    int height = 0;
    int depth = 0;
    std::string url;
};

/// Contents of a device description document (the XML found at the location of a search response)
struct device_description
{
    spec_version spec;
    std::string url_base;
    std::string device_type;
    std::string friendly_name;
    std::string manufacturer;
    std::string manufacturer_url;
    std::string model_description;
    std::string model_name;
    std::string model_number;
    std::string model_url;
    std::string serial_number;
    std::string udn;
    std::string upc;
    std::string presentation_url;
    std::vector<icon> icons;
};

/// Decodes a device description document. Throws discovery::decode_error if the XML is malformed.
device_description parse_device_description(std::string_view xml);

class description_fetcher
{
public:

    virtual ~description_fetcher() = default;

    /// Retrieves and decodes the description at location.
    /// Throws discovery::fetch_error or discovery::decode_error.
    virtual device_description fetch(const http::url& location) const = 0;
};

class http_description_fetcher : public description_fetcher
{
public:

    explicit http_description_fetcher(bool verbose = false)
        : m_verbose {verbose}
    {}

    device_description fetch(const http::url& location) const override;

private:

    bool m_verbose;

};

} // namespace upnp

#endif
