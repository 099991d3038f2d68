#ifndef HTTP_URL_HPP
#define HTTP_URL_HPP

#include <string>
#include <string_view>
#include <cstdint>

namespace http
{

/// Absolute URL of the form scheme://[userinfo@]host[:port][/path][?query][#fragment]
class url
{
public:

    url() = default;

    /// Throws std::invalid_argument if the string is not an absolute URL
    static url parse(std::string_view str);

    std::string to_string() const;

    const std::string& get_scheme() const { return m_scheme; }

    const std::string& get_host() const { return m_host; }

    /// Explicit port or the default port of the scheme
    uint16_t get_port() const;

    bool has_port() const { return !m_port.empty(); }

    const std::string& get_path() const { return m_path; }

    const std::string& get_query() const { return m_query; }

    /// Path and query as used in a request line, "/" if the path is empty
    std::string request_target() const;

    /// Host with explicit port, as used in a Host header
    std::string authority() const;

    bool operator==(const url& other) const;

    bool operator!=(const url& other) const
    {
        return !(*this == other);
    }

private:

    std::string m_scheme;    /// lowercased scheme (e.g. http)
    std::string m_userinfo;
    std::string m_host;      /// host name or address, brackets kept for ipv6 literals
    std::string m_port;      /// port as written, empty if not present
    std::string m_path;
    std::string m_query;
    std::string m_fragment;
    bool m_has_query = false;
    bool m_has_fragment = false;

};

} // namespace http

#endif
