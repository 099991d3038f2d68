#include "http/date.hpp"

#include <array>
#include <cctype>
#include <ctime>
#include <optional>
#include <stdexcept>

namespace http
{

static const std::array<std::string_view, 7> weekdays {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"
};

// Layout characters: 'A' is a letter, '9' a digit, '_' a digit or a space, anything else must match as is
static bool matches_layout(std::string_view input, std::string_view layout)
{
    if(input.size() != layout.size())
        return false;

    for(size_t i = 0; i < layout.size(); i++)
    {
        const unsigned char c = static_cast<unsigned char>(input[i]);
        switch(layout[i])
        {
            case 'A':
                if(!std::isalpha(c))
                    return false;
                break;
            case '9':
                if(!std::isdigit(c))
                    return false;
                break;
            case '_':
                if(c != ' ' && !std::isdigit(c))
                    return false;
                break;
            default:
                if(input[i] != layout[i])
                    return false;
        }
    }
    return true;
}

static bool is_zone_name(std::string_view zone)
{
    if(zone.size() < 3)
        return false;

    for(char c : zone)
    {
        if(!std::isupper(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

// strptime checks the names and ranges, the layout has already been checked
static std::optional<std::time_t> parse_with(const std::string& input, const char* format)
{
    std::tm tm {};
    const char* end = strptime(input.c_str(), format, &tm);
    if(end == nullptr || *end != '\0')
        return std::nullopt;

    // timegm normalizes the fields in place, so an impossible date like Feb 31 shows up as a change
    std::tm normalized = tm;
    std::time_t t = timegm(&normalized);
    if(normalized.tm_year != tm.tm_year || normalized.tm_mon != tm.tm_mon || normalized.tm_mday != tm.tm_mday ||
        normalized.tm_hour != tm.tm_hour || normalized.tm_min != tm.tm_min || normalized.tm_sec != tm.tm_sec)
        return std::nullopt;

    return t;
}

static std::optional<std::time_t> parse_rfc850(std::string_view date)
{
    size_t comma = date.find(", ");
    if(comma == std::string_view::npos)
        return std::nullopt;

    std::string_view weekday = date.substr(0, comma);
    bool known = false;
    for(std::string_view name : weekdays)
        known = known || weekday == name;
    if(!known)
        return std::nullopt;

    // Any zone abbreviation is accepted and read as UTC
    std::string_view rest = date.substr(comma + 2);
    constexpr std::string_view layout {"99-AAA-99 99:99:99 "};
    if(rest.size() <= layout.size() || !matches_layout(rest.substr(0, layout.size()), layout) ||
        !is_zone_name(rest.substr(layout.size())))
        return std::nullopt;

    const std::string input {date.substr(0, comma + 2 + layout.size() - 1)};
    return parse_with(input, "%A, %d-%b-%y %H:%M:%S");
}

time_point parse_date(std::string_view date)
{
    const std::string input {date};
    std::optional<std::time_t> parsed;

    if(matches_layout(date, "AAA, 99 AAA 9999 99:99:99 GMT"))
        parsed = parse_with(input, "%a, %d %b %Y %H:%M:%S GMT");
    else if(matches_layout(date, "AAA AAA _9 99:99:99 9999"))
        parsed = parse_with(input, "%a %b %e %H:%M:%S %Y");
    else
        parsed = parse_rfc850(date);

    if(!parsed)
        throw std::invalid_argument {"invalid_http_date"};

    return std::chrono::system_clock::from_time_t(*parsed);
}

std::string format_date(time_point tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm {};
    gmtime_r(&t, &tm);

    std::array<char, 64> buffer;
    size_t len = std::strftime(buffer.data(), buffer.size(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return std::string {buffer.data(), len};
}

} // namespace http
