#include "stdinc.hpp"

#include "parley/net/endpoint.hpp"
#include "parley/net/websockets/websocket-transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket.hpp>

#include <catch2/catch.hpp>

#include <chrono>

namespace parley::net::test {

namespace asio = boost::asio;
namespace websocket = boost::beast::websocket;
using tcp = asio::ip::tcp;

namespace {

// ---------------------------------------------------------------------------------------- EchoServer
// Serves one websocket session on 127.0.0.1, echoing every message. With
// `close_after_echo` it closes the session with 4000 "bye" after the first echo.
class EchoServer {
private:
  asio::io_context io_context_;
  tcp::acceptor acceptor_{io_context_, tcp::endpoint{asio::ip::make_address("127.0.0.1"), 0}};
  bool close_after_echo_;
  std::atomic<bool> accepted_{false};
  std::thread thread_;

public:
  explicit EchoServer(bool close_after_echo) : close_after_echo_{close_after_echo} {
    thread_ = std::thread{[this]() { serve_(); }};
  }

  ~EchoServer() {
    if (!accepted_.load()) {
      // Release a server still blocked in accept
      boost::system::error_code ignored;
      tcp::socket socket{io_context_};
      socket.connect(acceptor_.local_endpoint(), ignored);
    }
    thread_.join();
  }

  uint16_t port() const { return acceptor_.local_endpoint().port(); }

  Endpoint endpoint() const {
    return Endpoint{.secure = false, .host = "127.0.0.1", .port = port(), .path = "/"};
  }

private:
  void serve_() {
    try {
      tcp::socket socket{io_context_};
      acceptor_.accept(socket);
      accepted_.store(true);

      websocket::stream<tcp::socket> ws{std::move(socket)};
      ws.accept();
      for (;;) {
        boost::beast::flat_buffer buffer;
        ws.read(buffer);
        ws.text(ws.got_text());
        ws.write(buffer.data());
        if (close_after_echo_) {
          ws.close(websocket::close_reason{static_cast<websocket::close_code>(4000), "bye"});
          return;
        }
      }
    } catch (boost::system::system_error& e) {
      // The client closed the session, or went away
      TRACE("echo server finished: {}", e.what());
    }
  }
};

// ------------------------------------------------------------------------------------ RecordingEvents

struct RecordingEvents final : public TransportEvents {
  struct CloseRecord {
    uint16_t code;
    string reason;
    bool remote;
  };

  std::size_t opens = 0;
  vector<string> messages{};
  vector<CloseRecord> closes{};
  vector<std::pair<WebsocketOperation, std::error_code>> errors{};

  void on_open() override { ++opens; }

  void on_message(std::span<const std::byte> payload) override {
    messages.emplace_back(reinterpret_cast<const char*>(payload.data()), payload.size());
  }

  void on_close(uint16_t code, std::string_view reason, bool remote) override {
    closes.push_back({code, string{reason}, remote});
  }

  void on_error(WebsocketOperation operation, std::error_code ec) override {
    errors.emplace_back(operation, ec);
  }
};

template<typename Predicate> bool run_until(asio::io_context& io_context, Predicate&& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (!predicate()) {
    if (std::chrono::steady_clock::now() > deadline)
      return false;
    if (io_context.stopped())
      io_context.restart();
    io_context.run_one_for(std::chrono::milliseconds(10));
  }
  return true;
}

} // namespace

// ----------------------------------------------------------------------------- websocket-transport

CATCH_TEST_CASE("websocket-transport", "[websocket-transport]") {
  CATCH_SECTION("echo-then-local-close") {
    EchoServer server{false};
    asio::io_context io_context;
    RecordingEvents events;
    WebsocketTransport transport{io_context, events};

    transport.open(server.endpoint());
    transport.send_message(make_send_buffer("hello")); // Queued until the handshake completes

    CATCH_REQUIRE(run_until(io_context, [&]() { return events.messages.size() == 1; }));
    CATCH_REQUIRE(events.opens == 1);
    CATCH_REQUIRE(events.messages[0] == "hello");

    transport.close(k_close_normal, "done");
    CATCH_REQUIRE(run_until(io_context, [&]() { return !events.closes.empty(); }));
    CATCH_REQUIRE(events.closes.size() == 1);
    CATCH_REQUIRE(events.closes[0].code == k_close_normal);
    CATCH_REQUIRE(events.closes[0].remote == false);
    CATCH_REQUIRE(events.errors.empty());
  }

  CATCH_SECTION("server-closes") {
    EchoServer server{true};
    asio::io_context io_context;
    RecordingEvents events;
    WebsocketTransport transport{io_context, events};

    transport.open(server.endpoint());
    CATCH_REQUIRE(run_until(io_context, [&]() { return events.opens == 1; }));
    transport.send_message(make_send_buffer("hello"));

    CATCH_REQUIRE(run_until(io_context, [&]() { return !events.closes.empty(); }));
    CATCH_REQUIRE(events.messages == vector<string>{"hello"});
    CATCH_REQUIRE(events.closes.size() == 1);
    CATCH_REQUIRE(events.closes[0].code == 4000);
    CATCH_REQUIRE(events.closes[0].reason == "bye");
    CATCH_REQUIRE(events.closes[0].remote == true);
    CATCH_REQUIRE(events.errors.empty());
  }

  CATCH_SECTION("close-while-connecting") {
    EchoServer server{false};
    asio::io_context io_context;
    RecordingEvents events;
    WebsocketTransport transport{io_context, events};

    transport.open(server.endpoint());
    transport.close(k_close_normal, "never mind");

    CATCH_REQUIRE(run_until(io_context, [&]() { return !events.closes.empty(); }));
    io_context.restart();
    io_context.poll();

    CATCH_REQUIRE(events.opens == 0);
    CATCH_REQUIRE(events.closes.size() == 1);
    CATCH_REQUIRE(events.closes[0].code == k_close_normal);
    CATCH_REQUIRE(events.closes[0].reason == "never mind");
    CATCH_REQUIRE(events.closes[0].remote == false);
    CATCH_REQUIRE(events.errors.empty());
  }

  CATCH_SECTION("connect-refused") {
    uint16_t port = 0;
    {
      // Bind then release a port, so that nothing is listening on it
      asio::io_context scratch_context;
      const auto address = asio::ip::make_address("127.0.0.1");
      tcp::acceptor acceptor{scratch_context, tcp::endpoint{address, 0}};
      port = acceptor.local_endpoint().port();
    }
    asio::io_context io_context;
    RecordingEvents events;
    WebsocketTransport transport{io_context, events};

    transport.open(Endpoint{.secure = false, .host = "127.0.0.1", .port = port, .path = "/"});
    CATCH_REQUIRE(run_until(io_context, [&]() { return !events.errors.empty(); }));
    CATCH_REQUIRE(events.opens == 0);
    CATCH_REQUIRE(events.errors[0].first == WebsocketOperation::CONNECT);
    CATCH_REQUIRE(events.errors[0].second);
  }

  CATCH_SECTION("never-opened") {
    asio::io_context io_context;
    RecordingEvents events;
    WebsocketTransport transport{io_context, events};
    transport.send_message(make_send_buffer("nobody")); // Never opened: dropped
    transport.close(k_close_normal, "");         // Never opened: nothing happens
    io_context.poll();
    CATCH_REQUIRE(events.closes.empty());
    CATCH_REQUIRE(events.errors.empty());
  }
}

} // namespace parley::net::test
