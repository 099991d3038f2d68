#ifndef SSDP_SEARCH_TARGET_HPP
#define SSDP_SEARCH_TARGET_HPP

#include <string_view>

namespace discovery
{

enum class search_target
{
    all,
    root_device
};

constexpr std::string_view to_string(search_target st)
{
    switch(st)
    {
        case search_target::all:
            return "ssdp:all";
        case search_target::root_device:
            return "upnp:rootdevice";
    }
    return "ssdp:all";
}

} // namespace discovery

#endif
