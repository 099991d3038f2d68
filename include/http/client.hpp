#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <string>
#include <string_view>

#include "http/response.hpp"
#include "http/url.hpp"

namespace http
{

/// Blocking GET of an http:// url. The body of the returned response is already decoded.
/// Redirects (301, 302, 303, 307, 308) with a Location header are followed up to 10 times.
/// Throws std::invalid_argument for unsupported urls or malformed responses and
/// std::runtime_error if the host can not be reached or the connection breaks.
response get(const url& location);

/// Decodes a body sent with Transfer-Encoding: chunked.
/// Throws std::invalid_argument if the body is malformed or incomplete.
std::string decode_chunked(std::string_view body);

} // namespace http

#endif
