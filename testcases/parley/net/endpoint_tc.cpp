#include "stdinc.hpp"

#include "parley/net/endpoint.hpp"

#include <catch2/catch.hpp>

namespace parley::net::test {

CATCH_TEST_CASE("endpoint", "[endpoint]") {
  CATCH_SECTION("endpoint-defaults") {
    auto ws = parse_endpoint("ws://localhost");
    CATCH_REQUIRE(ws.has_value());
    CATCH_REQUIRE(ws->secure == false);
    CATCH_REQUIRE(ws->host == "localhost");
    CATCH_REQUIRE(ws->port == 80);
    CATCH_REQUIRE(ws->path == "/");

    auto wss = parse_endpoint("wss://room.example.org");
    CATCH_REQUIRE(wss.has_value());
    CATCH_REQUIRE(wss->secure == true);
    CATCH_REQUIRE(wss->port == 443);
  }

  CATCH_SECTION("endpoint-port-and-path") {
    auto endpoint = parse_endpoint("wss://10.0.0.7:8443/room?token=x");
    CATCH_REQUIRE(endpoint.has_value());
    CATCH_REQUIRE(endpoint->host == "10.0.0.7");
    CATCH_REQUIRE(endpoint->port == 8443);
    CATCH_REQUIRE(endpoint->path == "/room?token=x");
    CATCH_REQUIRE(endpoint->to_string() == "wss://10.0.0.7:8443/room?token=x");
  }

  CATCH_SECTION("endpoint-rejects") {
    for (auto url : {"", "http://localhost/", "ws://", "ws://:80/", "ws://host:0",
                     "ws://host:65536", "ws://host:12ab", "ws://host:/x"}) {
      auto endpoint = parse_endpoint(url);
      CATCH_REQUIRE(!endpoint.has_value());
      CATCH_REQUIRE(endpoint.error() == ecode::argument_error);
    }
  }
}

} // namespace parley::net::test
