#include <gtest/gtest.h>

#include "json_export.hpp"

TEST(json_export, search_response)
{
    discovery::search_response res;
    res.st = "ssdp:all";
    res.usn = "uuid:123";
    res.location = http::url::parse("http://10.0.0.5:80/desc.xml");
    res.date = std::chrono::system_clock::from_time_t(784111777);
    res.response_addr = discovery::endpoint {"10.0.0.5", 1900};

    json j = res;

    EXPECT_EQ(j["st"], "ssdp:all");
    EXPECT_EQ(j["usn"], "uuid:123");
    EXPECT_EQ(j["server"], "");
    EXPECT_EQ(j["location"], "http://10.0.0.5:80/desc.xml");
    EXPECT_EQ(j["date"], "Sun, 06 Nov 1994 08:49:37 GMT");
    EXPECT_EQ(j["response_addr"]["address"], "10.0.0.5");
    EXPECT_EQ(j["response_addr"]["port"], 1900);
}

TEST(json_export, absent_location_and_date_are_null)
{
    json j = discovery::search_response {};

    EXPECT_TRUE(j["location"].is_null());
    EXPECT_TRUE(j["date"].is_null());
}

TEST(json_export, device_description_uses_xml_names)
{
    upnp::device_description desc;
    desc.spec = upnp::spec_version {1, 0};
    desc.friendly_name = "tv";
    desc.udn = "uuid:1";
    desc.icons.push_back(upnp::icon {"image/png", 48, 48, 24, "/icon.png"});

    json j = desc;

    EXPECT_EQ(j["specVersion"]["major"], 1);
    EXPECT_EQ(j["specVersion"]["minor"], 0);
    EXPECT_EQ(j["friendlyName"], "tv");
    EXPECT_EQ(j["UDN"], "uuid:1");
    ASSERT_EQ(j["icons"].size(), 1u);
    EXPECT_EQ(j["icons"][0]["mimetype"], "image/png");
    EXPECT_EQ(j["icons"][0]["width"], 48);
}
