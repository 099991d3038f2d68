#include "http/url.hpp"

#include <cctype>
#include <charconv>
#include <stdexcept>

namespace http
{

static bool valid_scheme(std::string_view scheme)
{
    if(scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front())))
        return false;

    for(char c : scheme)
    {
        if(!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.')
            return false;
    }
    return true;
}

static bool contains_ctl_or_space(std::string_view view)
{
    for(char c : view)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        if(uc <= 0x20 || uc == 0x7f)
            return true;
    }
    return false;
}

url url::parse(std::string_view str)
{
    url parsed;

    if(str.empty() || contains_ctl_or_space(str))
        throw std::invalid_argument {"invalid_url"};

    size_t pos = str.find(':');
    if(pos == std::string_view::npos || !valid_scheme(str.substr(0, pos)))
        throw std::invalid_argument {"url_missing_scheme"};

    for(char c : str.substr(0, pos))
        parsed.m_scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    str.remove_prefix(pos + 1);

    if(str.substr(0, 2) != "//")
        throw std::invalid_argument {"url_not_absolute"};
    str.remove_prefix(2);

    /* Split off fragment and query before looking at the authority */
    if((pos = str.find('#')) != std::string_view::npos)
    {
        parsed.m_fragment = std::string {str.substr(pos + 1)};
        parsed.m_has_fragment = true;
        str = str.substr(0, pos);
    }
    if((pos = str.find('?')) != std::string_view::npos)
    {
        parsed.m_query = std::string {str.substr(pos + 1)};
        parsed.m_has_query = true;
        str = str.substr(0, pos);
    }

    pos = str.find('/');
    std::string_view authority = str.substr(0, pos);
    if(pos != std::string_view::npos)
        parsed.m_path = std::string {str.substr(pos)};

    if((pos = authority.rfind('@')) != std::string_view::npos)
    {
        parsed.m_userinfo = std::string {authority.substr(0, pos)};
        authority.remove_prefix(pos + 1);
    }

    std::string_view port_view;
    if(!authority.empty() && authority.front() == '[')
    {
        // ipv6 literal
        size_t close = authority.find(']');
        if(close == std::string_view::npos)
            throw std::invalid_argument {"url_invalid_host"};

        parsed.m_host = std::string {authority.substr(0, close + 1)};
        std::string_view rest = authority.substr(close + 1);
        if(!rest.empty())
        {
            if(rest.front() != ':')
                throw std::invalid_argument {"url_invalid_host"};
            port_view = rest.substr(1);
        }
    }
    else
    {
        pos = authority.find(':');
        parsed.m_host = std::string {authority.substr(0, pos)};
        if(pos != std::string_view::npos)
            port_view = authority.substr(pos + 1);
    }

    if(parsed.m_host.empty())
        throw std::invalid_argument {"url_missing_host"};

    if(!port_view.empty())
    {
        unsigned int port = 0;
        auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port);
        if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size() || port > 65535)
            throw std::invalid_argument {"url_invalid_port"};
        parsed.m_port = std::string {port_view};
    }

    return parsed;
}

uint16_t url::get_port() const
{
    if(!m_port.empty())
        return static_cast<uint16_t>(std::stoi(m_port));
    if(m_scheme == "https")
        return 443;
    return 80;
}

std::string url::request_target() const
{
    std::string target = m_path.empty() ? std::string {"/"} : m_path;
    if(m_has_query)
        (target += "?") += m_query;
    return target;
}

std::string url::authority() const
{
    if(m_port.empty())
        return m_host;
    return m_host + ":" + m_port;
}

std::string url::to_string() const
{
    std::string str {m_scheme};
    str += "://";
    if(!m_userinfo.empty())
        (str += m_userinfo) += "@";
    str += authority();
    str += m_path;
    if(m_has_query)
        (str += "?") += m_query;
    if(m_has_fragment)
        (str += "#") += m_fragment;
    return str;
}

bool url::operator==(const url& other) const
{
    return m_scheme == other.m_scheme &&
        m_userinfo == other.m_userinfo &&
        m_host == other.m_host &&
        m_port == other.m_port &&
        m_path == other.m_path &&
        m_has_query == other.m_has_query &&
        m_query == other.m_query &&
        m_has_fragment == other.m_has_fragment &&
        m_fragment == other.m_fragment;
}

} // namespace http
