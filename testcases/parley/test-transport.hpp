#pragma once

#include "parley/net/transport.hpp"
#include "parley/rpc/rpc-sink.hpp"
#include "parley/utils.hpp"

#include <boost/asio/io_context.hpp>

#include <mutex>

namespace parley::test {

// ---------------------------------------------------------------------------------- TransportScript
// What the test sees of the transports a factory created, and how it drives them.
struct TransportScript {
  std::mutex padlock;
  vector<string> sent{};           // Every payload sent, over all transports
  std::size_t created = 0;
  std::size_t opens = 0;
  std::size_t closes = 0;
  uint16_t last_close_code = 0;
  bool refuse_create = false;      // The factory returns nullptr
  net::TransportEvents* events = nullptr; // The live transport's events, if any

  // Called (in the dispatch context) for every payload sent
  std::function<void(std::string_view)> on_send{};

  vector<string> sent_messages() {
    lock_guard lock{padlock};
    return sent;
  }

  void emit_open() { with_events_([](auto& e) { e.on_open(); }); }

  void emit_message(std::string_view text) {
    with_events_([text](auto& e) {
      e.on_message({reinterpret_cast<const std::byte*>(text.data()), text.size()});
    });
  }

  void emit_close(uint16_t code = net::k_close_normal, std::string_view reason = "",
                  bool remote = false) {
    with_events_([&](auto& e) { e.on_close(code, reason, remote); });
  }

  void emit_error(net::WebsocketOperation op, std::error_code ec) {
    with_events_([&](auto& e) { e.on_error(op, ec); });
  }

private:
  template<typename F> void with_events_(F&& f) {
    lock_guard lock{padlock};
    if (events != nullptr)
      f(*events);
  }
};

// ------------------------------------------------------------------------------------ TestTransport

class TestTransport final : public net::Transport {
private:
  shared_ptr<TransportScript> script_;
  net::TransportEvents& events_;

public:
  TestTransport(shared_ptr<TransportScript> script, net::TransportEvents& events)
      : script_{std::move(script)}, events_{events} {}

  ~TestTransport() override {
    lock_guard lock{script_->padlock};
    if (script_->events == &events_)
      script_->events = nullptr;
  }

  void open(const net::Endpoint&) override {
    lock_guard lock{script_->padlock};
    ++script_->opens;
    script_->events = &events_;
  }

  void send_message(net::BufferType&& buffer) override {
    string text{net::to_string_view(net::to_span_bytes(buffer))};
    std::function<void(std::string_view)> hook;
    {
      lock_guard lock{script_->padlock};
      script_->sent.push_back(text);
      hook = script_->on_send;
    }
    if (hook)
      hook(text);
  }

  void close(uint16_t close_code, std::string_view) override {
    lock_guard lock{script_->padlock};
    ++script_->closes;
    script_->last_close_code = close_code;
  }
};

inline net::TransportFactory make_test_factory(shared_ptr<TransportScript> script) {
  return [script](net::TransportEvents& events) -> unique_ptr<net::Transport> {
    {
      lock_guard lock{script->padlock};
      ++script->created;
      if (script->refuse_create)
        return nullptr;
    }
    return make_unique<TestTransport>(script, events);
  };
}

/// Run every ready handler of a single threaded test io_context
inline void drain(boost::asio::io_context& io_context) {
  io_context.restart();
  io_context.poll();
}

// ------------------------------------------------------------------------------------ RecordingSink

struct RecordingSink : public rpc::RpcSink {
  struct ResponseRecord {
    int64_t id;
    rpc::Status status;
    nlohmann::json result;
  };
  struct CloseRecord {
    uint16_t code;
    string reason;
    bool remote;
  };

  std::mutex padlock;
  vector<string> events{};  // One line per callback, in order
  vector<ResponseRecord> responses{};
  vector<std::pair<string, nlohmann::json>> notifications{};
  vector<std::pair<int64_t, string>> requests{};
  vector<CloseRecord> closes{};
  vector<std::pair<std::error_code, string>> errors{};
  std::size_t opens = 0;

  void on_open() override {
    lock_guard lock{padlock};
    ++opens;
    events.push_back("open");
  }

  void on_response(int64_t id, const rpc::Status& status, const nlohmann::json& result) override {
    lock_guard lock{padlock};
    responses.push_back({id, status, result});
    events.push_back(format("response {}", id));
  }

  void on_notification(std::string_view method, const nlohmann::json& params) override {
    lock_guard lock{padlock};
    notifications.emplace_back(string{method}, params);
    events.push_back(format("notification {}", method));
  }

  void on_request(int64_t id, std::string_view method, const nlohmann::json& params) override {
    lock_guard lock{padlock};
    requests.emplace_back(id, string{method});
    events.push_back(format("request {}", id));
  }

  void on_connection_closed(uint16_t code, std::string_view reason, bool remote) override {
    lock_guard lock{padlock};
    closes.push_back({code, string{reason}, remote});
    events.push_back(format("closed {}", code));
  }

  void on_error(std::error_code ec, std::string_view detail) override {
    lock_guard lock{padlock};
    errors.emplace_back(ec, string{detail});
    events.push_back(format("error {}", ec.message()));
  }
};

} // namespace parley::test
