#include "stdinc.hpp"

#include "parley/rpc/rpc-client.hpp"

#include "parley/test-transport.hpp"

#include <catch2/catch.hpp>

namespace parley::rpc::test {

using parley::test::drain;
using parley::test::make_test_factory;
using parley::test::RecordingSink;
using parley::test::TransportScript;

namespace {
struct Harness {
  boost::asio::io_context io_context;
  shared_ptr<TransportScript> script = make_shared<TransportScript>();
  RecordingSink sink;
  unique_ptr<RpcClient> client;

  explicit Harness(RpcClient::NotConnectedPolicy policy = RpcClient::NotConnectedPolicy::DROP) {
    RpcClient::Config config;
    config.url = "ws://localhost:8888/room";
    config.not_connected_policy = policy;
    client = make_unique<RpcClient>(io_context, config, make_test_factory(script), sink);
  }

  void connect() {
    client->connect();
    drain(io_context);
    script->emit_open();
    drain(io_context);
    CATCH_REQUIRE(client->is_connected());
  }

  nlohmann::json sent(std::size_t index) {
    return nlohmann::json::parse(script->sent_messages().at(index));
  }

  void receive(std::string_view text) {
    script->emit_message(text);
    drain(io_context);
  }
};

// Records continuation outcomes as "id:ok" or "id:<error message>"
struct OutcomeLog {
  vector<string> lines;

  Continuation for_call(int64_t id) {
    return [this, id](const Status& status, const nlohmann::json&) {
      lines.push_back(format("{}:{}", id, status.ok() ? "ok" : status.code().message()));
    };
  }
};
} // namespace

// ------------------------------------------------------------------------------------- scenarios

CATCH_TEST_CASE("rpc-client-scenarios", "[rpc-client]") {
  Harness h;

  CATCH_SECTION("send-while-connected-and-resolve") {
    h.connect();
    h.client->send("join", {{"user", "alice"}, {"room", "r1"}}, 1);
    drain(h.io_context);

    const auto request = h.sent(0);
    CATCH_REQUIRE(request["method"] == "join");
    CATCH_REQUIRE(request["params"] == nlohmann::json{{"user", "alice"}, {"room", "r1"}});
    CATCH_REQUIRE(request["id"] == 1);
    CATCH_REQUIRE(h.client->pending_calls() == 1);

    h.receive(R"({"jsonrpc":"2.0","id":1,"result":{"users":[]}})");
    CATCH_REQUIRE(h.sink.responses.size() == 1);
    CATCH_REQUIRE(h.sink.responses[0].id == 1);
    CATCH_REQUIRE(h.sink.responses[0].status.ok());
    CATCH_REQUIRE(h.sink.responses[0].result == nlohmann::json{{"users", nlohmann::json::array()}});
    CATCH_REQUIRE(h.client->pending_calls() == 0);
    CATCH_REQUIRE(h.sink.errors.empty());
  }

  CATCH_SECTION("fire-and-forget-is-never-registered") {
    h.connect();
    h.client->send("onIceCandidate", {{"candidate", "c"}}, k_no_reply);
    drain(h.io_context);
    CATCH_REQUIRE(h.client->pending_calls() == 0);
    CATCH_REQUIRE(h.sent(0).contains("id") == false);

    h.receive(R"({"id":-1,"result":{}})");
    CATCH_REQUIRE(h.sink.responses.empty());
    CATCH_REQUIRE(h.sink.errors.size() == 1);
    CATCH_REQUIRE(h.sink.errors[0].first == ecode::invalid_data);
  }

  CATCH_SECTION("duplicate-id") {
    OutcomeLog log;
    h.connect();
    h.client->send("first", {}, 5);
    h.client->send("second", {}, 5);
    h.client->call("third", {}, 5, log.for_call(5));
    drain(h.io_context);

    CATCH_REQUIRE(h.script->sent_messages().size() == 1);
    CATCH_REQUIRE(h.sent(0)["method"] == "first");
    CATCH_REQUIRE(h.sink.errors.size() == 1);
    CATCH_REQUIRE(h.sink.errors[0].first == ecode::duplicate_id);
    CATCH_REQUIRE(log.lines == vector<string>{"5:call id already pending"});

    // The first call is undisturbed
    h.receive(R"({"id":5,"result":"done"})");
    CATCH_REQUIRE(h.sink.responses.size() == 1);
    CATCH_REQUIRE(h.sink.responses[0].result == "done");
  }

  CATCH_SECTION("close-resolves-pending-in-registration-order") {
    OutcomeLog log;
    h.connect();
    for (auto id : {3, 1, 2})
      h.client->call("m", {}, id, log.for_call(id));
    drain(h.io_context);
    CATCH_REQUIRE(h.client->pending_calls() == 3);

    h.script->emit_close(1001, "going away", true);
    drain(h.io_context);

    CATCH_REQUIRE(log.lines
                  == vector<string>{"3:connection lost", "1:connection lost",
                                    "2:connection lost"});
    CATCH_REQUIRE(h.client->state() == net::ConnectionState::DISCONNECTED);
    CATCH_REQUIRE(h.sink.closes.size() == 1);
    CATCH_REQUIRE(h.sink.closes[0].code == 1001);
    CATCH_REQUIRE(h.sink.closes[0].reason == "going away");
    CATCH_REQUIRE(h.sink.closes[0].remote == true);
  }

  CATCH_SECTION("close-reports-sent-calls-through-the-sink") {
    h.connect();
    h.client->send("a", {}, 10);
    h.client->send("b", {}, 11);
    drain(h.io_context);

    h.script->emit_close();
    drain(h.io_context);
    CATCH_REQUIRE(h.sink.events
                  == vector<string>{"open", "response 10", "response 11", "closed 1000"});
    for (const auto& response : h.sink.responses)
      CATCH_REQUIRE(response.status.code() == ecode::connection_lost);
  }
}

// ------------------------------------------------------------------------------------ properties

CATCH_TEST_CASE("rpc-client-properties", "[rpc-client]") {
  Harness h;
  OutcomeLog log;

  CATCH_SECTION("resolved-exactly-once") {
    h.connect();
    h.client->call("a", {}, 1, log.for_call(1));
    h.client->call("b", {}, 2, log.for_call(2));
    drain(h.io_context);

    h.receive(R"({"id":1,"result":null})");
    h.receive(R"({"id":1,"result":null})"); // a duplicate response is stray

    // A close, and then a late response of the same connection
    h.script->emit_close();
    h.script->emit_message(R"({"id":2,"result":null})");
    drain(h.io_context);

    CATCH_REQUIRE(log.lines == vector<string>{"1:ok", "2:connection lost"});
    CATCH_REQUIRE(h.sink.errors.size() == 1);
  }

  CATCH_SECTION("registration-precedes-next-send") {
    vector<std::pair<std::size_t, uint64_t>> at_send; // (pending calls, dispatch sequence)
    h.script->on_send = [&](std::string_view) {
      at_send.emplace_back(h.client->pending_calls(), h.client->dispatch_sequence());
    };
    h.connect();
    h.client->call("A", {}, 1, log.for_call(1));
    h.client->call("B", {}, 2, log.for_call(2));
    drain(h.io_context);

    CATCH_REQUIRE(at_send.size() == 2);
    CATCH_REQUIRE(at_send[0].first == 1); // A registered before A's send
    CATCH_REQUIRE(at_send[1].first == 2); // ... and still pending at B's send
    CATCH_REQUIRE(at_send[0].second < at_send[1].second);
    CATCH_REQUIRE(h.sent(0)["method"] == "A");
    CATCH_REQUIRE(h.sent(1)["method"] == "B");

    h.receive(R"({"id":2,"result":{}})");
    h.receive(R"({"id":1,"result":{}})");
    CATCH_REQUIRE(log.lines == vector<string>{"2:ok", "1:ok"});
  }

  CATCH_SECTION("routing-is-exclusive") {
    h.connect();
    h.client->call("a", {}, 7, log.for_call(7));
    drain(h.io_context);

    h.receive(R"({"method":"participantJoined","params":{"id":"bob"}})");
    h.receive(R"({"method":"ping","id":7})");
    CATCH_REQUIRE(log.lines.empty());
    CATCH_REQUIRE(h.sink.notifications.size() == 1);
    CATCH_REQUIRE(h.sink.requests.size() == 1);

    h.receive(R"({"id":7,"error":{"code":104,"message":"Room closed"}})");
    CATCH_REQUIRE(log.lines == vector<string>{"7:server reported an error"});
    CATCH_REQUIRE(h.sink.notifications.size() == 1);
    CATCH_REQUIRE(h.sink.requests.size() == 1);
    CATCH_REQUIRE(h.sink.errors.empty());
  }

  CATCH_SECTION("disconnect-is-idempotent") {
    h.client->disconnect();
    drain(h.io_context);
    CATCH_REQUIRE(h.script->closes == 0);

    h.connect();
    h.client->disconnect();
    h.client->disconnect();
    drain(h.io_context);
    CATCH_REQUIRE(h.script->closes == 1);
    CATCH_REQUIRE(h.script->last_close_code == net::k_close_normal);
    CATCH_REQUIRE(h.client->state() == net::ConnectionState::CLOSING);

    h.script->emit_close();
    drain(h.io_context);
    h.client->disconnect();
    drain(h.io_context);

    CATCH_REQUIRE(h.script->closes == 1);
    CATCH_REQUIRE(h.sink.closes.size() == 1);
    CATCH_REQUIRE(h.sink.errors.empty());
  }
}

// -------------------------------------------------------------------------------- not-connected

CATCH_TEST_CASE("rpc-client-not-connected", "[rpc-client]") {
  OutcomeLog log;

  CATCH_SECTION("drop-policy") {
    Harness h;
    h.client->send("a", {}, 1);
    h.client->connect();
    h.client->send("b", {}, 2); // still CONNECTING
    drain(h.io_context);
    CATCH_REQUIRE(h.script->sent_messages().empty());
    CATCH_REQUIRE(h.sink.errors.empty());
    CATCH_REQUIRE(h.client->pending_calls() == 0);
  }

  CATCH_SECTION("sends-after-disconnect-are-not-delivered") {
    Harness h;
    h.connect();
    h.client->disconnect();
    h.client->send("x", {}, 9);
    h.client->call("y", {}, 10, log.for_call(10));
    drain(h.io_context);

    CATCH_REQUIRE(h.client->state() == net::ConnectionState::CLOSING);
    CATCH_REQUIRE(h.script->sent_messages().empty());
    CATCH_REQUIRE(h.client->pending_calls() == 0);
    CATCH_REQUIRE(log.lines == vector<string>{"10:not connected"});

    h.script->emit_close();
    drain(h.io_context);
    CATCH_REQUIRE(h.script->sent_messages().empty());
    CATCH_REQUIRE(log.lines.size() == 1);
    CATCH_REQUIRE(h.sink.errors.empty());
  }

  CATCH_SECTION("report-policy") {
    Harness h{RpcClient::NotConnectedPolicy::REPORT};
    h.client->send("a", {}, 1);
    h.client->respond(3, nlohmann::json{});
    drain(h.io_context);
    CATCH_REQUIRE(h.script->sent_messages().empty());
    CATCH_REQUIRE(h.sink.errors.size() == 2);
    CATCH_REQUIRE(h.sink.errors[0].first == ecode::not_connected);
    CATCH_REQUIRE(h.sink.errors[1].first == ecode::not_connected);
  }

  CATCH_SECTION("continuation-always-hears") {
    Harness h;
    h.client->call("a", {}, 1, log.for_call(1));
    drain(h.io_context);
    CATCH_REQUIRE(log.lines == vector<string>{"1:not connected"});
    CATCH_REQUIRE(h.sink.errors.empty());
  }

  CATCH_SECTION("call-requires-an-id") {
    Harness h;
    h.connect();
    h.client->call("a", {}, k_no_reply, log.for_call(k_no_reply));
    drain(h.io_context);
    CATCH_REQUIRE(log.lines == vector<string>{"-1:argument error"});
    CATCH_REQUIRE(h.script->sent_messages().empty());
  }
}

// ---------------------------------------------------------------------------------- connection

CATCH_TEST_CASE("rpc-client-connection", "[rpc-client]") {
  Harness h;

  CATCH_SECTION("transport-refused") {
    h.script->refuse_create = true;
    h.client->connect();
    drain(h.io_context);
    CATCH_REQUIRE(h.sink.events == vector<string>{"error failed to open connection", "closed 1006"});
    CATCH_REQUIRE(h.client->state() == net::ConnectionState::DISCONNECTED);
  }

  CATCH_SECTION("connect-failure") {
    h.client->connect();
    drain(h.io_context);
    h.script->emit_error(net::WebsocketOperation::CONNECT,
                         std::make_error_code(std::errc::connection_refused));
    drain(h.io_context);
    CATCH_REQUIRE(h.sink.errors.size() == 1);
    CATCH_REQUIRE(h.sink.errors[0].first == ecode::connect_failure);
    CATCH_REQUIRE(h.sink.closes.size() == 1);
    CATCH_REQUIRE(h.sink.closes[0].code == net::k_close_abnormal);
    CATCH_REQUIRE(h.sink.opens == 0);
    CATCH_REQUIRE(h.client->state() == net::ConnectionState::DISCONNECTED);
  }

  CATCH_SECTION("connection-lost") {
    OutcomeLog log;
    h.connect();
    h.client->call("a", {}, 1, log.for_call(1));
    drain(h.io_context);
    h.script->emit_error(net::WebsocketOperation::READ,
                         std::make_error_code(std::errc::connection_reset));
    drain(h.io_context);
    CATCH_REQUIRE(log.lines == vector<string>{"1:connection lost"});
    CATCH_REQUIRE(h.sink.errors.size() == 1);
    CATCH_REQUIRE(h.sink.errors[0].first == ecode::connection_lost);
    CATCH_REQUIRE(h.sink.closes.size() == 1);
  }

  CATCH_SECTION("connect-is-idempotent") {
    h.connect();
    h.client->connect();
    drain(h.io_context);
    CATCH_REQUIRE(h.script->created == 1);
    CATCH_REQUIRE(h.sink.opens == 1);
  }

  CATCH_SECTION("connect-while-closing-is-deferred") {
    h.connect();
    h.client->disconnect();
    h.client->connect();
    drain(h.io_context);
    CATCH_REQUIRE(h.script->created == 1);
    CATCH_REQUIRE(h.client->state() == net::ConnectionState::CLOSING);

    h.script->emit_close();
    drain(h.io_context);
    CATCH_REQUIRE(h.script->created == 2);
    CATCH_REQUIRE(h.client->state() == net::ConnectionState::CONNECTING);

    h.script->emit_open();
    drain(h.io_context);
    CATCH_REQUIRE(h.sink.opens == 2);
    CATCH_REQUIRE(h.sink.events == vector<string>{"open", "closed 1000", "open"});
  }

  CATCH_SECTION("disconnect-cancels-deferred-connect") {
    h.connect();
    h.client->disconnect();
    h.client->connect();
    h.client->disconnect();
    drain(h.io_context);
    h.script->emit_close();
    drain(h.io_context);
    CATCH_REQUIRE(h.script->created == 1);
    CATCH_REQUIRE(h.client->state() == net::ConnectionState::DISCONNECTED);
  }

  CATCH_SECTION("undecodable-messages-are-diagnosed") {
    h.connect();
    h.receive("garbage");
    h.receive(R"({"id":"x","result":1})");
    CATCH_REQUIRE(h.sink.errors.size() == 2);
    CATCH_REQUIRE(h.sink.errors[0].first == ecode::decode_error);
    CATCH_REQUIRE(h.client->is_connected());
  }

  CATCH_SECTION("answer-server-requests") {
    h.connect();
    h.receive(R"({"method":"ping","id":4})");
    CATCH_REQUIRE(h.sink.requests == vector<std::pair<int64_t, string>>{{4, "ping"}});

    h.client->respond(4, nlohmann::json{{"pong", true}});
    h.client->respond_error(5, ErrorObject{k_method_not_found, "no such method", {}});
    drain(h.io_context);
    CATCH_REQUIRE(h.sent(0)["id"] == 4);
    CATCH_REQUIRE(h.sent(0)["result"]["pong"] == true);
    CATCH_REQUIRE(h.sent(1)["id"] == 5);
    CATCH_REQUIRE(h.sent(1)["error"]["code"] == k_method_not_found);
  }

  CATCH_SECTION("destroying-the-client") {
    OutcomeLog log;
    h.connect();
    h.client->call("a", {}, 1, log.for_call(1));
    h.client->send("b", {}, 2);
    drain(h.io_context);

    const auto events_before = h.sink.events;
    h.client.reset();
    drain(h.io_context);

    CATCH_REQUIRE(log.lines == vector<string>{"1:connection lost"});
    CATCH_REQUIRE(h.sink.events == events_before); // the sink was detached
    CATCH_REQUIRE(h.script->closes == 1);
    CATCH_REQUIRE(h.script->events == nullptr);
  }

  CATCH_SECTION("invalid-url") {
    RpcClient::Config config;
    config.url = "http://localhost/";
    CATCH_REQUIRE_THROWS_AS(
        RpcClient(h.io_context, config, make_test_factory(h.script), h.sink), std::runtime_error);
  }
}

// ---------------------------------------------------------------------------------- robustness

namespace {
struct ThrowingSink final : public RecordingSink {
  void on_notification(std::string_view method, const nlohmann::json& params) override {
    RecordingSink::on_notification(method, params);
    throw std::runtime_error("listener failure");
  }
};
} // namespace

CATCH_TEST_CASE("rpc-client-throwing-sink", "[rpc-client]") {
  boost::asio::io_context io_context;
  auto script = make_shared<TransportScript>();
  ThrowingSink sink;
  RpcClient client{io_context, {.url = "ws://localhost/"}, make_test_factory(script), sink};

  client.connect();
  drain(io_context);
  script->emit_open();
  script->emit_message(R"({"method":"first"})");
  script->emit_message(R"({"method":"second"})");
  drain(io_context);

  CATCH_REQUIRE(sink.events == vector<string>{"open", "notification first", "notification second"});
}

} // namespace parley::rpc::test
