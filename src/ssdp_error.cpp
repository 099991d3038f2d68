#include "ssdp_error.hpp"

namespace discovery
{

const char* to_string(error_kind kind)
{
    switch(kind)
    {
        case error_kind::address_resolution:
            return "address resolution error";
        case error_kind::serialization:
            return "serialization error";
        case error_kind::bind:
            return "bind error";
        case error_kind::send:
            return "send error";
        case error_kind::receive:
            return "receive error";
        case error_kind::parse:
            return "parse error";
        case error_kind::fetch:
            return "fetch error";
        case error_kind::decode:
            return "decode error";
    }
    return "unknown error";
}

} // namespace discovery
