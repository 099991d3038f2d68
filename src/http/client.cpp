#include "http/client.hpp"

#include "http/request.hpp"
#include "utils.hpp"

#include "fmt/format.h"
#include <socketwrapper.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <optional>
#include <stdexcept>

namespace http
{

#define MAX_REDIRECTS 10

static bool try_decode_chunked(std::string_view body, std::string& decoded)
{
    decoded.clear();
    while(true)
    {
        size_t endl = body.find("\r\n");
        if(endl == std::string_view::npos)
            return false;

        // Chunk extensions after ';' are ignored
        std::string_view size_view = utils::trim(body.substr(0, std::min(endl, body.find(';'))));
        size_t chunk_size = 0;
        auto res = std::from_chars(size_view.data(), size_view.data() + size_view.size(), chunk_size, 16);
        if(size_view.empty() || res.ec != std::errc {} || res.ptr != size_view.data() + size_view.size())
            return false;
        body.remove_prefix(endl + 2);

        if(chunk_size == 0)
        {
            // Skip trailers up to the final empty line
            while(true)
            {
                endl = body.find("\r\n");
                if(endl == std::string_view::npos)
                    return false;
                if(endl == 0)
                    return true;
                body.remove_prefix(endl + 2);
            }
        }

        // The announced size comes from the peer, compare without adding to it
        if(chunk_size > body.size() || body.size() - chunk_size < 2 || body.substr(chunk_size, 2) != "\r\n")
            return false;

        decoded.append(body.data(), chunk_size);
        body.remove_prefix(chunk_size + 2);
    }
}

std::string decode_chunked(std::string_view body)
{
    std::string decoded;
    if(!try_decode_chunked(body, decoded))
        throw std::invalid_argument {"invalid_chunked_body"};
    return decoded;
}

static std::optional<size_t> content_length(const response& res)
{
    if(!res.check_header("Content-Length"))
        return std::nullopt;

    std::string value = res.get_header("Content-Length");
    size_t length = 0;
    auto conv = std::from_chars(value.data(), value.data() + value.size(), length);
    if(value.empty() || conv.ec != std::errc {} || conv.ptr != value.data() + value.size())
        throw std::invalid_argument {"invalid_content_length"};
    return length;
}

// Checks if the bytes received so far contain a whole response, so we do not depend on the peer closing
static bool message_complete(std::string_view raw)
{
    size_t header_end = header_block_end(raw);
    if(header_end == std::string_view::npos)
        return false;

    response head {raw.substr(0, header_end)};
    if(utils::iequals(head.get_header("Transfer-Encoding"), "chunked"))
    {
        std::string decoded;
        return try_decode_chunked(raw.substr(header_end), decoded);
    }

    if(auto length = content_length(head))
        return raw.size() - header_end >= *length;

    return false;
}

// Location of a redirect may be relative to the url that answered with it
static url redirect_target(const url& from, std::string_view location)
{
    if(location.find("://") != std::string_view::npos)
        return url::parse(location);

    std::string base = fmt::format("{}://{}", from.get_scheme(), from.authority());
    if(location.empty() || location.front() != '/')
    {
        const std::string& path = from.get_path();
        size_t slash = path.rfind('/');
        base += slash == std::string::npos ? "/" : path.substr(0, slash + 1);
    }
    return url::parse(base + std::string {location});
}

static bool is_redirect(int code)
{
    return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
}

static response get_once(const url& location)
{
    if(location.get_scheme() != "http")
        throw std::invalid_argument {fmt::format("unsupported scheme '{}'", location.get_scheme())};
    if(location.get_host().empty())
        throw std::invalid_argument {"url without host"};
    if(location.get_host().front() == '[')
        throw std::invalid_argument {"ipv6 hosts are not supported"};

    std::string addr = utils::resolve_ipv4(location.get_host());
    net::tcp_connection<net::ip_version::v4> conn {addr, location.get_port()};

    request req {"GET", location.request_target()};
    req.set_header("Host", location.authority());
    req.set_header("Accept", "*/*");
    req.set_header("Connection", "close");

    std::string req_str = req.to_string();
    conn.send(net::span {req_str.begin(), req_str.end()});

    // Receive HTTP response containing the XML body
    std::string raw;
    std::array<char, 4096> buffer;
    while(!message_complete(raw))
    {
        size_t br = conn.read(net::span {buffer});
        if(br == 0)
            break;
        raw.append(buffer.data(), br);
    }

    response res {raw};
    if(utils::iequals(res.get_header("Transfer-Encoding"), "chunked"))
    {
        res.set_body(decode_chunked(res.get_body()));
    }
    else if(auto length = content_length(res))
    {
        if(res.get_body().size() < *length)
            throw std::runtime_error {"connection closed before the end of the body"};

        std::string body = res.get_body().substr(0, *length);
        res.set_body(std::move(body));
    }

    return res;
}

response get(const url& location)
{
    url target = location;
    for(int hops = 0; ; hops++)
    {
        response res = get_once(target);
        if(!is_redirect(res.get_code()) || !res.check_header("Location"))
            return res;

        if(hops == MAX_REDIRECTS)
            throw std::runtime_error {fmt::format("stopped after {} redirects", MAX_REDIRECTS)};

        target = redirect_target(target, res.get_header("Location"));
    }
}

} // namespace http
