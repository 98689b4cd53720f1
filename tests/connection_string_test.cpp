#include "hub_client/connection_string.hpp"
#include "hub_client/url.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace hub_client;

TEST_CASE("Connection string yields endpoint, key and version", "[config]") {
    auto cs = parse_connection_string(
        "Endpoint=https://demo.service.signalr.net;AccessKey=abc+/def==;Version=1.0;");
    REQUIRE(cs.endpoint == "https://demo.service.signalr.net");
    REQUIRE(cs.access_key == "abc+/def==");
    REQUIRE(cs.version == "1.0");
}

TEST_CASE("Connection string keys are case-insensitive and order-free", "[config]") {
    auto cs = parse_connection_string(" accesskey = k ; ENDPOINT=http://localhost/ ");
    REQUIRE(cs.endpoint == "http://localhost");
    REQUIRE(cs.access_key == "k");
    REQUIRE(cs.version.empty());
}

TEST_CASE("Port is spliced into the endpoint authority", "[config]") {
    auto cs = parse_connection_string("Endpoint=http://localhost;Port=8080;AccessKey=k;Version=1.0;");
    REQUIRE(cs.endpoint == "http://localhost:8080");
}

TEST_CASE("Malformed connection strings are rejected", "[config]") {
    REQUIRE_THROWS_AS(parse_connection_string("AccessKey=k"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_connection_string("Endpoint=https://x"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_connection_string("Endpoint=https://x;garbage;AccessKey=k"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_connection_string("Endpoint=ftp://x;AccessKey=k"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_connection_string("Endpoint=https://x;AccessKey=k;Port=80a"), std::invalid_argument);
}

TEST_CASE("URL splitting keeps the target verbatim", "[config]") {
    auto url = parse_url("https://demo.service.signalr.net/api/v1/hubs/chat/users/a?b=1");
    REQUIRE(url.secure);
    REQUIRE(url.host == "demo.service.signalr.net");
    REQUIRE(url.port == "443");
    REQUIRE(url.target == "/api/v1/hubs/chat/users/a?b=1");

    auto plain = parse_url("http://127.0.0.1:9000");
    REQUIRE_FALSE(plain.secure);
    REQUIRE(plain.host == "127.0.0.1");
    REQUIRE(plain.port == "9000");
    REQUIRE(plain.target == "/");

    REQUIRE_THROWS_AS(parse_url("ws://x/"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("https:///path"), std::invalid_argument);
}
