#include <http/response.hpp>

#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace http
{

// Reads one line starting at pos, without its line ending. Returns false if there is no line ending left.
static bool next_line(std::string_view raw, size_t& pos, std::string_view& line)
{
    size_t endl = raw.find('\n', pos);
    if(endl == std::string_view::npos)
        return false;

    line = raw.substr(pos, endl - pos);
    if(!line.empty() && line.back() == '\r')
        line.remove_suffix(1);

    pos = endl + 1;
    return true;
}

static bool all_digits(std::string_view view)
{
    return !view.empty() && std::all_of(view.begin(), view.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}

size_t header_block_end(std::string_view raw)
{
    size_t pos = 0;
    std::string_view line;

    /* Skip the status line */
    if(!next_line(raw, pos, line))
        return std::string_view::npos;

    while(next_line(raw, pos, line))
    {
        if(line.empty())
            return pos;
    }
    return std::string_view::npos;
}

void response::parse(std::string_view raw)
{
    size_t pos = 0;
    std::string_view line;

    m_headers.clear();

    if(!next_line(raw, pos, line))
        throw std::invalid_argument {"invalid_response"};
    parse_statusline(line);

    /* Read and parse response headers */
    while(true)
    {
        if(!next_line(raw, pos, line))
            throw std::invalid_argument {"unexpected_end_of_headers"};

        if(line.empty())
            break;

        // Obsolete line folding continues the previous header value
        if(line.front() == ' ' || line.front() == '\t')
        {
            if(m_headers.empty())
                throw std::invalid_argument {"invalid_header_line"};

            std::string_view folded = utils::trim(line);
            if(!folded.empty())
            {
                std::string& value = m_headers.back().second;
                if(!value.empty())
                    value += " ";
                value += folded;
            }
            continue;
        }

        size_t sep = line.find(':');
        if(sep == std::string_view::npos)
            throw std::invalid_argument {"invalid_header_line"};

        std::string_view key {line.data(), sep};
        if(key.empty() || key.find_first_of(" \t") != std::string_view::npos)
            throw std::invalid_argument {"invalid_header_name"};

        m_headers.emplace_back(std::string {key}, std::string {utils::trim(line.substr(sep + 1))});
    }

    m_body = std::string {raw.substr(pos)};
}

void response::parse_statusline(std::string_view statusline)
{
    size_t sep = statusline.find(' ');
    if(sep == std::string_view::npos)
        throw std::invalid_argument {"invalid_statusline"};

    std::string_view protocol = statusline.substr(0, sep);
    std::string_view version = protocol.substr(0, 5) == "HTTP/" ? protocol.substr(5) : std::string_view {};
    size_t dot = version.find('.');
    if(dot == std::string_view::npos || !all_digits(version.substr(0, dot)) || !all_digits(version.substr(dot + 1)))
        throw std::invalid_argument {"invalid_protocol"};

    std::string_view rest = statusline.substr(sep + 1);
    sep = rest.find(' ');
    std::string_view code = rest.substr(0, sep);
    if(code.size() != 3 || !all_digits(code))
        throw std::invalid_argument {"invalid_status_code"};

    m_protocol = std::string {protocol};
    m_code = (code[0] - '0') * 100 + (code[1] - '0') * 10 + (code[2] - '0');
    m_phrase = (sep == std::string_view::npos) ? std::string {} : std::string {rest.substr(sep + 1)};
}

bool response::check_header(std::string_view key) const
{
    return std::any_of(m_headers.begin(), m_headers.end(), [key](const auto& header) {
        return utils::iequals(header.first, key);
    });
}

std::string response::get_header(std::string_view key) const
{
    for(const auto& [name, value] : m_headers)
    {
        if(utils::iequals(name, key))
            return value;
    }
    return "";
}

} // namespace http
