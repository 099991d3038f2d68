#include "http/request.hpp"

#include "utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace http
{

static bool is_token(std::string_view view)
{
    if(view.empty())
        return false;

    return std::none_of(view.begin(), view.end(), [](char c) {
        unsigned char uc = static_cast<unsigned char>(c);
        return uc <= 0x20 || uc == 0x7f || c == ':';
    });
}

static bool breaks_line(std::string_view view)
{
    return view.find_first_of("\r\n") != std::string_view::npos;
}

request::request(std::string method, std::string target)
    : m_method {std::move(method)},
      m_target {std::move(target)}
{}

std::string request::to_string() const
{
    if(!is_token(m_method))
        throw std::invalid_argument {"invalid_method"};
    if(m_target.empty() || m_target.find_first_of(" \r\n") != std::string::npos)
        throw std::invalid_argument {"invalid_request_target"};

    // The target is written as is, so "*" stays a literal asterisk
    std::string request {m_method};
    ((((request += " ") += m_target) += " ") += m_protocol) += "\r\n";

    for(const auto& [key, value] : m_headers)
    {
        if(!is_token(key))
            throw std::invalid_argument {"invalid_header_name"};
        if(breaks_line(value))
            throw std::invalid_argument {"invalid_header_value"};

        request += key;
        if(value.empty())
            request += ":";
        else
            (request += ": ") += value;
        request += "\r\n";
    }

    request += "\r\n";
    request += m_body;

    return request;
}

void request::set_header(const std::string& key, std::string value)
{
    auto it = std::find_if(m_headers.begin(), m_headers.end(), [&key](const auto& header) {
        return utils::iequals(header.first, key);
    });

    if(it != m_headers.end())
        it->second = std::move(value);
    else
        m_headers.emplace_back(key, std::move(value));
}

bool request::check_header(std::string_view key) const
{
    return std::any_of(m_headers.begin(), m_headers.end(), [key](const auto& header) {
        return utils::iequals(header.first, key);
    });
}

std::string request::get_header(std::string_view key) const
{
    for(const auto& [name, value] : m_headers)
    {
        if(utils::iequals(name, key))
            return value;
    }
    return "";
}

} // namespace http
