#include <gtest/gtest.h>

#include "ssdp_discovery.hpp"

using namespace discovery;

TEST(build_search_request, produces_exact_bytes)
{
    config cfg = config {}.with_timeout(2000);

    search_request req = build_search_request(cfg, "upnp:rootdevice");

    EXPECT_EQ(req.bytes,
        "M-SEARCH * HTTP/1.1\r\n"
        "Host: 239.235.255.250:9000\r\n"
        "User-Agent:\r\n"
        "st: upnp:rootdevice\r\n"
        "man: \"ssdp:discover\"\r\n"
        "mx: 2\r\n"
        "\r\n");
    EXPECT_EQ(req.destination, (endpoint {"239.235.255.250", 9000}));
}

TEST(build_search_request, keeps_literal_asterisk_in_request_line)
{
    search_request req = build_search_request(config {}.with_timeout(2000), "upnp:rootdevice");

    std::string request_line = req.bytes.substr(0, req.bytes.find("\r\n"));
    EXPECT_EQ(request_line, "M-SEARCH * HTTP/1.1");
    EXPECT_EQ(req.bytes.find("%2A"), std::string::npos);
    EXPECT_EQ(req.bytes.find("/*"), std::string::npos);
}

TEST(build_search_request, mx_is_truncated_to_whole_seconds)
{
    EXPECT_NE(build_search_request(config {}.with_timeout(2999), "ssdp:all").bytes.find("\r\nmx: 2\r\n"), std::string::npos);
    EXPECT_NE(build_search_request(config {}.with_timeout(999), "ssdp:all").bytes.find("\r\nmx: 0\r\n"), std::string::npos);
    EXPECT_NE(build_search_request(config {}, "ssdp:all").bytes.find("\r\nmx: 0\r\n"), std::string::npos);
}

TEST(build_search_request, host_header_uses_configured_address)
{
    config cfg;
    cfg.with_broadcast("239.255.255.250").with_port(1900);

    search_request req = build_search_request(cfg, "ssdp:all");

    EXPECT_NE(req.bytes.find("\r\nHost: 239.255.255.250:1900\r\n"), std::string::npos);
    EXPECT_EQ(req.destination.to_string(), "239.255.255.250:1900");
}

TEST(build_search_request, resolves_host_names)
{
    search_request req = build_search_request(config {}.with_broadcast("localhost"), "ssdp:all");

    EXPECT_EQ(req.destination.addr, "127.0.0.1");
}

TEST(build_search_request, unparseable_address_fails)
{
    EXPECT_THROW(build_search_request(config {}.with_broadcast("999.999.999.999"), "ssdp:all"), address_resolution_error);
    EXPECT_THROW(build_search_request(config {}.with_broadcast(""), "ssdp:all"), address_resolution_error);
}

TEST(build_search_request, line_break_in_search_target_fails)
{
    try {
        build_search_request(config {}, "ssdp:all\r\nman: evil");
        FAIL() << "expected serialization_error";
    } catch(const ssdp_error& err) {
        EXPECT_EQ(err.kind(), error_kind::serialization);
    }
}
