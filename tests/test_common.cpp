/*
* @license
* (C) zachbabanov
*
*/

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <common.hpp>
#include <logger.hpp>
#include <udp_socket.hpp>

#include <unordered_set>

using namespace framecast::common;
using namespace framecast::net;
using namespace framecast::log;

TEST_CASE("hton/ntoh roundtrip uint32", "[common]") {
    uint32_t v = 0x12345678;
    uint32_t net = hton_u32(v);
    uint32_t host = ntoh_u32(net);
    REQUIRE(host == v);

    // network order puts the most significant byte first
    const unsigned char *b = (const unsigned char*)&net;
    REQUIRE(b[0] == 0x12);
    REQUIRE(b[3] == 0x78);
}

TEST_CASE("hton/ntoh roundtrip uint16", "[common]") {
    uint16_t v = 0xABCD;
    uint16_t net = hton_u16(v);
    uint16_t host = ntoh_u16(net);
    REQUIRE(host == v);
}

TEST_CASE("elapsed_ms clamps negative intervals", "[common]") {
    auto t0 = Clock::now();
    auto t1 = t0 + std::chrono::milliseconds(250);
    REQUIRE(elapsed_ms(t0, t1) == 250);
    REQUIRE(elapsed_ms(t1, t0) == 0);
    REQUIRE(elapsed_ms(t0, t0) == 0);
}

TEST_CASE("Endpoint sockaddr conversion and formatting", "[common][endpoint]") {
    Endpoint e;
    REQUIRE(resolve_endpoint("192.168.1.20", 9999, e));
    REQUIRE(e.ip == 0xC0A80114u);
    REQUIRE(e.port == 9999);
    REQUIRE(e.to_string() == "192.168.1.20:9999");

    sockaddr_in sa = e.to_sockaddr();
    REQUIRE(sa.sin_family == AF_INET);
    REQUIRE(Endpoint::from_sockaddr(sa) == e);
}

TEST_CASE("Endpoint identity is address and port together", "[common][endpoint]") {
    Endpoint a{0x7F000001u, 5000};
    Endpoint b{0x7F000001u, 5001};
    Endpoint c{0x7F000002u, 5000};

    REQUIRE(a != b);
    REQUIRE(a != c);
    REQUIRE(a < b);
    REQUIRE(a == Endpoint{0x7F000001u, 5000});

    std::unordered_set<Endpoint, EndpointHash> set{a, b, c, a};
    REQUIRE(set.size() == 3);
}

TEST_CASE("resolve_endpoint handles dotted quads and host names", "[common][endpoint]") {
    Endpoint e;
    REQUIRE(resolve_endpoint("10.1.2.3", 7000, e));
    REQUIRE(e.ip == 0x0A010203u);
    REQUIRE(e.port == 7000);

    // host names go through the resolver
    REQUIRE(resolve_endpoint("localhost", 9999, e));
    REQUIRE(e.ip == 0x7F000001u);
    REQUIRE(e.port == 9999);

    REQUIRE_FALSE(resolve_endpoint("no-such-host.invalid", 1, e));
}

TEST_CASE("parse_level accepts known names only", "[common][logger]") {
    Level l = Level::INFO;
    REQUIRE(parse_level("debug", l));
    REQUIRE(l == Level::DEBUG);
    REQUIRE(parse_level("WARNING", l));
    REQUIRE(l == Level::WARN);
    REQUIRE(parse_level("trace", l));
    REQUIRE(l == Level::TRACE);
    REQUIRE_FALSE(parse_level("verbose", l));
    REQUIRE(l == Level::TRACE);
}
