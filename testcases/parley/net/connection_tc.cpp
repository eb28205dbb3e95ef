#include "stdinc.hpp"

#include "parley/net/connection.hpp"

#include "parley/test-transport.hpp"

#include <catch2/catch.hpp>

namespace parley::net::test {

namespace {
struct NullEvents final : public TransportEvents {
  void on_open() override {}
  void on_message(std::span<const std::byte>) override {}
  void on_close(uint16_t, std::string_view, bool) override {}
  void on_error(WebsocketOperation, std::error_code) override {}
};

Connection::EventsFactory null_events() {
  return [](uint64_t) -> unique_ptr<TransportEvents> { return make_unique<NullEvents>(); };
}

Endpoint test_endpoint() { return *parse_endpoint("ws://localhost:8080/room"); }
} // namespace

CATCH_TEST_CASE("connection", "[connection]") {
  auto script = make_shared<parley::test::TransportScript>();
  Connection connection{parley::test::make_test_factory(script)};

  CATCH_SECTION("connection-lifecycle") {
    CATCH_REQUIRE(connection.state() == ConnectionState::DISCONNECTED);
    CATCH_REQUIRE(!connection.open(test_endpoint(), null_events()));
    CATCH_REQUIRE(connection.state() == ConnectionState::CONNECTING);
    CATCH_REQUIRE(connection.generation() == 1);
    CATCH_REQUIRE(script->opens == 1);

    CATCH_REQUIRE(connection.handle_open());
    CATCH_REQUIRE(connection.is_connected());
    CATCH_REQUIRE(!connection.send(make_send_buffer("hello")));
    CATCH_REQUIRE(script->sent_messages() == vector<string>{"hello"});

    CATCH_REQUIRE(connection.close(4000, "bye"));
    CATCH_REQUIRE(connection.state() == ConnectionState::CLOSING);
    CATCH_REQUIRE(script->last_close_code == 4000);
    CATCH_REQUIRE(connection.send(make_send_buffer("late")) == ecode::not_connected);

    CATCH_REQUIRE(connection.handle_closed() == ConnectionState::CLOSING);
    CATCH_REQUIRE(connection.state() == ConnectionState::DISCONNECTED);
    CATCH_REQUIRE(script->events == nullptr); // transport released
  }

  CATCH_SECTION("connection-no-ops") {
    // Nothing to close
    CATCH_REQUIRE(!connection.close());
    CATCH_REQUIRE(script->closes == 0);

    CATCH_REQUIRE(!connection.open(test_endpoint(), null_events()));
    CATCH_REQUIRE(!connection.open(test_endpoint(), null_events())); // already connecting
    CATCH_REQUIRE(script->created == 1);
    CATCH_REQUIRE(connection.generation() == 1);

    CATCH_REQUIRE(connection.close());
    CATCH_REQUIRE(!connection.close()); // already closing
    CATCH_REQUIRE(script->closes == 1);
    CATCH_REQUIRE(!connection.handle_open()); // open raced with close
    CATCH_REQUIRE(connection.state() == ConnectionState::CLOSING);
  }

  CATCH_SECTION("connection-send-requires-connected") {
    CATCH_REQUIRE(connection.send(make_send_buffer("x")) == ecode::not_connected);
    CATCH_REQUIRE(!connection.open(test_endpoint(), null_events()));
    CATCH_REQUIRE(connection.send(make_send_buffer("x")) == ecode::not_connected);
    CATCH_REQUIRE(script->sent_messages().empty());
  }

  CATCH_SECTION("connection-failure-returns-to-disconnected") {
    CATCH_REQUIRE(!connection.open(test_endpoint(), null_events()));
    CATCH_REQUIRE(connection.handle_closed() == ConnectionState::CONNECTING);
    CATCH_REQUIRE(connection.state() == ConnectionState::DISCONNECTED);

    // A new generation
    CATCH_REQUIRE(!connection.open(test_endpoint(), null_events()));
    CATCH_REQUIRE(connection.generation() == 2);
  }

  CATCH_SECTION("connection-transport-refused") {
    script->refuse_create = true;
    CATCH_REQUIRE(connection.open(test_endpoint(), null_events()) == ecode::connect_failure);
    CATCH_REQUIRE(connection.state() == ConnectionState::DISCONNECTED);
  }
}

} // namespace parley::net::test
