#include <utils.hpp>

#include "fmt/format.h"

#include <array>
#include <memory>
#include <stdexcept>
#include <cctype>
#include <sys/socket.h>
#include <netdb.h>

namespace utils
{

std::string resolve_ipv4(const std::string& host)
{
    addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* result = nullptr;
    if(int ret = getaddrinfo(host.c_str(), nullptr, &hints, &result); ret != 0)
        throw std::runtime_error {fmt::format("Unable to resolve '{}': {}", host, gai_strerror(ret))};
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addrs {result, &freeaddrinfo};

    std::array<char, NI_MAXHOST> numeric;
    int s = getnameinfo(addrs->ai_addr, addrs->ai_addrlen, numeric.data(), numeric.size(), nullptr, 0, NI_NUMERICHOST);
    if(s != 0)
        throw std::runtime_error {fmt::format("Unable to resolve '{}': {}", host, gai_strerror(s))};

    return numeric.data();
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    if(lhs.size() != rhs.size())
        return false;

    for(size_t i = 0; i < lhs.size(); i++)
    {
        if(std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i])))
            return false;
    }
    return true;
}

std::string_view trim(std::string_view view)
{
    const char* whitespace = " \t\r\n";
    size_t start = view.find_first_not_of(whitespace);
    if(start == std::string_view::npos)
        return {};

    size_t end = view.find_last_not_of(whitespace);
    return view.substr(start, end - start + 1);
}

} // utils
