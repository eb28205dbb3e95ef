#include "stdinc.hpp"

#include "parley/rpc/codec.hpp"
#include "parley/rpc/router.hpp"

#include "parley/test-transport.hpp"

#include <catch2/catch.hpp>

namespace parley::rpc::test {

CATCH_TEST_CASE("router", "[router]") {
  PendingCallRegistry registry;
  parley::test::RecordingSink sink;
  vector<Status> outcomes;

  auto route_text = [&](std::string_view text) {
    auto message = decode(text);
    CATCH_REQUIRE(message.has_value());
    return route(std::move(*message), registry, sink);
  };

  CATCH_REQUIRE(!registry.insert(1, [&](const Status& status, const nlohmann::json&) {
    outcomes.push_back(status);
  }));

  CATCH_SECTION("route-response") {
    CATCH_REQUIRE(route_text(R"({"id":1,"result":{}})") == RouteOutcome::RESOLVED);
    CATCH_REQUIRE(outcomes.size() == 1);
    CATCH_REQUIRE(outcomes[0].ok());
    CATCH_REQUIRE(sink.events.empty());
  }

  CATCH_SECTION("route-error-response") {
    CATCH_REQUIRE(route_text(R"({"id":1,"error":{"code":104,"message":"no room"}})")
                  == RouteOutcome::RESOLVED);
    CATCH_REQUIRE(outcomes.size() == 1);
    CATCH_REQUIRE(outcomes[0].code() == ecode::protocol_error);
    CATCH_REQUIRE(outcomes[0].server_code() == 104);
    CATCH_REQUIRE(outcomes[0].message() == "no room");
  }

  CATCH_SECTION("route-stray-response") {
    CATCH_REQUIRE(route_text(R"({"id":2,"result":{}})") == RouteOutcome::STRAY);
    CATCH_REQUIRE(route_text(R"({"error":{"code":-32700,"message":"Parse error"}})")
                  == RouteOutcome::STRAY);
    CATCH_REQUIRE(outcomes.empty());
    CATCH_REQUIRE(registry.contains(1));
    CATCH_REQUIRE(sink.errors.size() == 2);
    CATCH_REQUIRE(sink.errors[0].first == ecode::invalid_data);
  }

  CATCH_SECTION("route-notification-and-request") {
    CATCH_REQUIRE(route_text(R"({"method":"participantLeft","params":{"name":"bob"}})")
                  == RouteOutcome::NOTIFICATION);
    CATCH_REQUIRE(route_text(R"({"method":"ping","id":1})") == RouteOutcome::REQUEST);
    CATCH_REQUIRE(sink.events == vector<string>{"notification participantLeft", "request 1"});
    CATCH_REQUIRE(sink.notifications[0].second["name"] == "bob");

    // A request never resolves a pending call of the same id
    CATCH_REQUIRE(registry.contains(1));
    CATCH_REQUIRE(outcomes.empty());
  }
}

} // namespace parley::rpc::test
