#include "stdinc.hpp"

#include "parley/portable/asio/asio-execution-context.hpp"
#include "parley/rpc/rpc-client.hpp"

#include "parley/test-transport.hpp"

#include <catch2/catch.hpp>

#include <chrono>

namespace parley::rpc::test {

using parley::test::make_test_factory;
using parley::test::RecordingSink;
using parley::test::TransportScript;

namespace {
template<typename Predicate> bool wait_for(Predicate&& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
  while (!predicate()) {
    if (std::chrono::steady_clock::now() > deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

// Every continuation outcome, per call id
struct OutcomeTable {
  std::mutex padlock;
  unordered_map<int64_t, vector<std::error_code>> outcomes;
  std::atomic<std::size_t> total{0};

  Continuation for_call(int64_t id) {
    return [this, id](const Status& status, const nlohmann::json&) {
      {
        lock_guard lock{padlock};
        outcomes[id].push_back(status.code());
      }
      total.fetch_add(1);
    };
  }
};

constexpr int k_threads = 4;
constexpr int k_calls_per_thread = 250;

void call_from_threads(RpcClient& client, OutcomeTable& table) {
  vector<std::thread> callers;
  for (int t = 0; t < k_threads; ++t) {
    callers.emplace_back([&client, &table, t]() {
      for (int i = 0; i < k_calls_per_thread; ++i) {
        const int64_t id = t * 1000 + i;
        client.call("work", {{"n", id}}, id, table.for_call(id));
      }
    });
  }
  for (auto& caller : callers)
    caller.join();
}
} // namespace

CATCH_TEST_CASE("rpc-client-concurrent-callers", "[rpc-client][concurrency]") {
  boost::asio::io_context io_context;
  OutcomeTable table;
  RecordingSink sink;
  auto script = make_shared<TransportScript>();
  net::AsioExecutionContext pool{io_context, 4};
  auto client = make_unique<RpcClient>(io_context, RpcClient::Config{.url = "ws://localhost/"},
                                       make_test_factory(script), sink);
  pool.run();

  client->connect();
  CATCH_REQUIRE(wait_for([&]() { return client->state() == net::ConnectionState::CONNECTING; }));
  script->emit_open();
  CATCH_REQUIRE(wait_for([&]() { return client->is_connected(); }));

  CATCH_SECTION("every-call-answered-once") {
    // The server answers every call as it is sent
    TransportScript* server = script.get();
    script->on_send = [server](std::string_view text) {
      const auto request = nlohmann::json::parse(text);
      server->emit_message(
          nlohmann::json{{"id", request["id"]}, {"result", request["params"]["n"]}}.dump());
    };

    call_from_threads(*client, table);
    CATCH_REQUIRE(wait_for([&]() { return table.total.load() == k_threads * k_calls_per_thread; }));

    lock_guard lock{table.padlock};
    CATCH_REQUIRE(table.outcomes.size() == std::size_t(k_threads * k_calls_per_thread));
    for (const auto& [id, codes] : table.outcomes) {
      CATCH_REQUIRE(codes.size() == 1);
      CATCH_REQUIRE(!codes[0]);
    }
    lock_guard sink_lock{sink.padlock};
    CATCH_REQUIRE(sink.errors.empty());
  }

  CATCH_SECTION("close-during-calls-orphans-nothing") {
    std::thread closer{[&script]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      script->emit_close(net::k_close_abnormal, "reset", true);
    }};
    call_from_threads(*client, table);
    closer.join();

    CATCH_REQUIRE(wait_for([&]() { return table.total.load() == k_threads * k_calls_per_thread; }));
    CATCH_REQUIRE(wait_for([&]() { return !client->is_connected(); }));

    lock_guard lock{table.padlock};
    for (const auto& [id, codes] : table.outcomes) {
      CATCH_REQUIRE(codes.size() == 1);
      CATCH_REQUIRE((codes[0] == ecode::connection_lost || codes[0] == ecode::not_connected));
    }
  }

  client.reset();
  pool.release();
  pool.join();
}

} // namespace parley::rpc::test
