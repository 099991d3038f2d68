#ifndef SSDP_SEARCH_UTILS_HPP
#define SSDP_SEARCH_UTILS_HPP

#include <string>
#include <string_view>

namespace utils
{

/// Resolves a host name or dotted quad to a numeric IPv4 address string.
/// Throws std::runtime_error if the host cannot be resolved.
std::string resolve_ipv4(const std::string& host);

bool iequals(std::string_view lhs, std::string_view rhs);

std::string_view trim(std::string_view view);

} // utils

#endif
