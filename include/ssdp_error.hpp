#ifndef SSDP_ERROR_HPP
#define SSDP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace discovery
{

enum class error_kind
{
    address_resolution,
    serialization,
    bind,
    send,
    receive,
    parse,
    fetch,
    decode
};

const char* to_string(error_kind kind);

class ssdp_error : public std::runtime_error
{
public:

    ssdp_error(error_kind kind, const std::string& what)
        : std::runtime_error {what},
          m_kind {kind}
    {}

    error_kind kind() const
    {
        return m_kind;
    }

private:

    error_kind m_kind;

};

template<error_kind K>
class kind_error : public ssdp_error
{
public:

    explicit kind_error(const std::string& what)
        : ssdp_error {K, what}
    {}
};

using address_resolution_error = kind_error<error_kind::address_resolution>;
using serialization_error = kind_error<error_kind::serialization>;
using bind_error = kind_error<error_kind::bind>;
using send_error = kind_error<error_kind::send>;
using receive_error = kind_error<error_kind::receive>;
using parse_error = kind_error<error_kind::parse>;
using fetch_error = kind_error<error_kind::fetch>;
using decode_error = kind_error<error_kind::decode>;

} // namespace discovery

#endif
