#ifndef HTTP_DATE_HPP
#define HTTP_DATE_HPP

#include <string>
#include <string_view>
#include <chrono>

namespace http
{

using time_point = std::chrono::system_clock::time_point;

/// Parses the three date formats HTTP/1.1 allows:
///   Sun, 06 Nov 1994 08:49:37 GMT  (IMF-fixdate)
///   Sunday, 06-Nov-94 08:49:37 GMT (RFC 850)
///   Sun Nov  6 08:49:37 1994       (asctime)
/// Throws std::invalid_argument for anything else.
time_point parse_date(std::string_view date);

/// Formats a time point as IMF-fixdate
std::string format_date(time_point tp);

} // namespace http

#endif
