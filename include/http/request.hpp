#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http {

/// Outgoing HTTP request. Headers are written in the order they were first set.
class request {

public:

    request() = default;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) = default;

    request(std::string method, std::string target);

    /// Serializes the request line, headers and body.
    /// Throws std::invalid_argument if any part would break the message framing.
    std::string to_string() const;

    /// Sets a header, replacing the value of an existing header with the same name (case-insensitive)
    void set_header(const std::string& key, std::string value);

    bool check_header(std::string_view key) const;

    std::string get_header(std::string_view key) const;

    const std::vector<std::pair<std::string, std::string>>& get_headers() const { return m_headers; }

    void set_body(std::string body) { m_body = std::move(body); }

    const std::string& get_method() const { return m_method; }

    const std::string& get_target() const { return m_target; }

    const std::string& get_protocol() const { return m_protocol; }

    const std::string& get_body() const { return m_body; }

private:

    std::string m_method;                   /// http method used by this request (e.g. GET, M-SEARCH, ...)
    std::string m_target;                   /// request target, written verbatim (e.g. "*" or "/desc.xml")
    std::string m_protocol {"HTTP/1.1"};
    std::string m_body;

    std::vector<std::pair<std::string, std::string>> m_headers;

};

} // namespace http

#endif
