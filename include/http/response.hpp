#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http
{

/// Incoming HTTP response: status line, header block and the raw bytes that follow it
class response
{
public:

    response() = default;

    /// Throws std::invalid_argument if the data is not an HTTP response
    explicit response(std::string_view raw)
    {
        parse(raw);
    }

    void parse(std::string_view raw);

    bool check_header(std::string_view key) const;

    /// Value of the first header with this name (case-insensitive) or an empty string
    std::string get_header(std::string_view key) const;

    const std::vector<std::pair<std::string, std::string>>& get_headers() const
    {
        return m_headers;
    }

    const std::string& get_protocol() const
    {
        return m_protocol;
    }

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_phrase() const
    {
        return m_phrase;
    }

    const std::string& get_body() const
    {
        return m_body;
    }

    void set_body(std::string&& body)
    {
        m_body = std::move(body);
    }

private:

    void parse_statusline(std::string_view statusline);

    std::string m_protocol;
    int m_code = 0;
    std::string m_phrase;
    std::string m_body;

    std::vector<std::pair<std::string, std::string>> m_headers;

};

/// Returns the offset of the first byte after the header block or npos if the block is incomplete
size_t header_block_end(std::string_view raw);

} // namespace http

#endif
