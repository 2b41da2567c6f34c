#include <doctest/doctest.h>
#include <raslink/endpoint.hpp>

TEST_CASE("Endpoint formatting") {
    SUBCASE("UdpEndpoint") {
        raslink::UdpEndpoint ep{"100.64.0.2", 9876};
        CHECK(ep.to_string() == "100.64.0.2:9876");
    }

    SUBCASE("LanEndpoint without interface") {
        raslink::LanEndpoint ep{"192.168.1.10", 8765, ""};
        CHECK(ep.to_string() == "192.168.1.10:8765");
    }

    SUBCASE("LanEndpoint with interface") {
        raslink::LanEndpoint ep{"192.168.1.10", 8765, "wlan0"};
        CHECK(ep.to_string() == "192.168.1.10:8765 via wlan0");
    }
}

TEST_CASE("IPv4 classification") {
    SUBCASE("parse") {
        auto octets = raslink::ipv4::parse("10.1.2.3");
        REQUIRE(octets.has_value());
        CHECK((*octets)[0] == 10);
        CHECK((*octets)[3] == 3);
        CHECK_FALSE(raslink::ipv4::parse("not-an-ip").has_value());
        CHECK_FALSE(raslink::ipv4::parse("fe80::1").has_value());
    }

    SUBCASE("mesh range is 100.64.0.0/10") {
        CHECK(raslink::ipv4::is_mesh("100.64.0.1"));
        CHECK(raslink::ipv4::is_mesh("100.101.102.103"));
        CHECK(raslink::ipv4::is_mesh("100.127.255.254"));
        CHECK_FALSE(raslink::ipv4::is_mesh("100.63.255.255"));
        CHECK_FALSE(raslink::ipv4::is_mesh("100.128.0.1"));
        CHECK_FALSE(raslink::ipv4::is_mesh("192.168.1.1"));
        CHECK_FALSE(raslink::ipv4::is_mesh(""));
    }

    SUBCASE("private ranges") {
        CHECK(raslink::ipv4::is_private("10.0.0.1"));
        CHECK(raslink::ipv4::is_private("172.16.5.4"));
        CHECK(raslink::ipv4::is_private("172.31.255.1"));
        CHECK(raslink::ipv4::is_private("192.168.0.9"));
        CHECK_FALSE(raslink::ipv4::is_private("172.32.0.1"));
        CHECK_FALSE(raslink::ipv4::is_private("8.8.8.8"));
        CHECK_FALSE(raslink::ipv4::is_private("100.64.0.1"));
    }

    SUBCASE("same /24") {
        CHECK(raslink::ipv4::same_subnet("192.168.1.10", "192.168.1.200"));
        CHECK_FALSE(raslink::ipv4::same_subnet("192.168.1.10", "192.168.2.10"));
        CHECK_FALSE(raslink::ipv4::same_subnet("192.168.1.10", "bogus"));
    }
}
