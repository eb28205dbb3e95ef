#include "rpc-client.hpp"

#include "codec.hpp"
#include "dispatcher.hpp"
#include "router.hpp"

#include "parley/net/connection.hpp"
#include "parley/net/endpoint.hpp"

#include <mutex>

namespace parley::rpc {

namespace detail {
// -------------------------------------------------------------------------------------- GuardedSink
// Forwards to the user's sink until detached. Detaching waits for a callback in progress.
class GuardedSink final : public RpcSink {
private:
  std::mutex padlock_;
  RpcSink* sink_ = nullptr;

  template<typename F> void notify_(std::string_view what, F&& f) {
    lock_guard lock{padlock_};
    if (sink_ == nullptr) {
      TRACE("sink detached, dropping {}", what);
      return;
    }
    try {
      f(*sink_);
    } catch (std::exception& e) {
      LOG_ERR("RpcSink::{} threw: {}", what, e.what());
    }
  }

public:
  explicit GuardedSink(RpcSink& sink) : sink_{&sink} {}

  void detach() {
    lock_guard lock{padlock_};
    sink_ = nullptr;
  }

  void on_open() override {
    notify_("on_open", [](RpcSink& s) { s.on_open(); });
  }

  void on_response(int64_t id, const Status& status, const nlohmann::json& result) override {
    notify_("on_response", [&](RpcSink& s) { s.on_response(id, status, result); });
  }

  void on_notification(std::string_view method, const nlohmann::json& params) override {
    notify_("on_notification", [&](RpcSink& s) { s.on_notification(method, params); });
  }

  void on_request(int64_t id, std::string_view method, const nlohmann::json& params) override {
    notify_("on_request", [&](RpcSink& s) { s.on_request(id, method, params); });
  }

  void on_connection_closed(uint16_t code, std::string_view reason, bool remote) override {
    notify_("on_connection_closed",
            [&](RpcSink& s) { s.on_connection_closed(code, reason, remote); });
  }

  void on_error(std::error_code ec, std::string_view detail) override {
    notify_("on_error", [&](RpcSink& s) { s.on_error(ec, detail); });
  }
};

static string abbreviate(std::string_view text, std::size_t max_length = 120) {
  if (text.size() <= max_length)
    return string{text};
  return format("{}... ({} bytes)", text.substr(0, max_length), text.size());
}

static void invoke_continuation(int64_t id, const Continuation& continuation,
                                const Status& status) {
  try {
    continuation(status, nlohmann::json{});
  } catch (std::exception& e) {
    LOG_ERR("continuation for call id={} threw: {}", id, e.what());
  }
}
} // namespace detail

// -------------------------------------------------------------------------------------------- Pimpl

struct RpcClient::Pimpl : public std::enable_shared_from_this<Pimpl> {
  class Listener;

  const Config config;
  const net::Endpoint endpoint;
  detail::GuardedSink sink;
  Dispatcher dispatcher;
  PendingCallRegistry registry{};
  bool connect_after_close = false;
  net::Connection connection; // Last, so the transport is destroyed first

  Pimpl(boost::asio::io_context& io_context, Config config_, net::Endpoint endpoint_,
        net::TransportFactory transport_factory, RpcSink& sink_)
      : config{std::move(config_)}
      , endpoint{std::move(endpoint_)}
      , sink{sink_}
      , dispatcher{io_context}
      , connection{std::move(transport_factory)} {}

  // ---- Actions from the public interface
  void do_connect_();
  void do_disconnect_();
  void do_send_(Call call, Continuation continuation);
  void do_respond_(int64_t id, expected<net::BufferType, error_code> buffer);
  void do_teardown_();

  // ---- Actions from the transport
  void handle_open_(uint64_t generation);
  void handle_message_(uint64_t generation, const string& text);
  void handle_close_(uint64_t generation, uint16_t code, const string& reason, bool remote);
  void handle_error_(uint64_t generation, net::WebsocketOperation op, error_code ec);

  bool is_stale_(uint64_t generation, std::string_view event) const;
  void finish_connection_(uint16_t code, std::string_view reason, bool remote);
  void reject_(const Call& call, const Continuation& continuation, error_code ec);
};

// ------------------------------------------------------------------------------- Pimpl::Listener
// Receives the events of one transport generation, and posts them to the dispatcher.
class RpcClient::Pimpl::Listener final : public net::TransportEvents {
private:
  weak_ptr<Pimpl> core_;
  uint64_t generation_;

  template<typename F> void post_(F&& f) {
    auto core = core_.lock();
    if (core == nullptr)
      return;
    core->dispatcher.post(
        [core, generation = generation_, f = std::forward<F>(f)]() { f(*core, generation); });
  }

public:
  Listener(weak_ptr<Pimpl> core, uint64_t generation)
      : core_{std::move(core)}, generation_{generation} {}

  void on_open() override {
    post_([](Pimpl& core, uint64_t generation) { core.handle_open_(generation); });
  }

  void on_message(std::span<const std::byte> payload) override {
    post_([text = string{net::to_string_view(payload)}](Pimpl& core, uint64_t generation) {
      core.handle_message_(generation, text);
    });
  }

  void on_close(uint16_t code, std::string_view reason, bool remote) override {
    post_([code, reason = string{reason}, remote](Pimpl& core, uint64_t generation) {
      core.handle_close_(generation, code, reason, remote);
    });
  }

  void on_error(net::WebsocketOperation op, std::error_code ec) override {
    post_([op, ec](Pimpl& core, uint64_t generation) { core.handle_error_(generation, op, ec); });
  }
};

// ---------------------------------------------------------------------------------- do_connect_

void RpcClient::Pimpl::do_connect_() {
  switch (connection.state()) {
  case net::ConnectionState::DISCONNECTED:
    break;
  case net::ConnectionState::CLOSING:
    TRACE("connect requested while closing, deferred");
    connect_after_close = true;
    return;
  case net::ConnectionState::CONNECTING:
  case net::ConnectionState::CONNECTED:
    TRACE("connect requested while {}, ignored", str(connection.state()));
    return;
  }

  weak_ptr<Pimpl> weak_self = shared_from_this();
  const auto ec = connection.open(endpoint, [weak_self](uint64_t generation) {
    return unique_ptr<net::TransportEvents>{make_unique<Listener>(weak_self, generation)};
  });

  if (ec) {
    sink.on_error(ec, format("could not open a transport to {}", endpoint.to_string()));
    sink.on_connection_closed(net::k_close_abnormal, ec.message(), false);
  }
}

// ------------------------------------------------------------------------------- do_disconnect_

void RpcClient::Pimpl::do_disconnect_() {
  connect_after_close = false;
  if (!connection.close(config.close_code, ""))
    TRACE("disconnect requested while {}, ignored", str(connection.state()));
}

// ------------------------------------------------------------------------------------- do_send_

void RpcClient::Pimpl::reject_(const Call& call, const Continuation& continuation,
                               error_code ec) {
  if (continuation) {
    detail::invoke_continuation(call.id, continuation, Status{ec});
    return;
  }
  sink.on_error(ec, format("call '{}' (id={}) not sent: {}", call.method, call.id, ec.message()));
}

void RpcClient::Pimpl::do_send_(Call call, Continuation continuation) {
  if (continuation && !call.expects_reply()) {
    reject_(call, continuation, make_error_code(ecode::argument_error));
    return;
  }

  if (!connection.is_connected()) {
    if (continuation || config.not_connected_policy == NotConnectedPolicy::REPORT) {
      reject_(call, continuation, make_error_code(ecode::not_connected));
    } else {
      TRACE("dropping call '{}' (id={}), connection is {}", call.method, call.id,
            str(connection.state()));
    }
    return;
  }

  if (call.expects_reply() && registry.contains(call.id)) {
    reject_(call, continuation, make_error_code(ecode::duplicate_id));
    return;
  }

  auto buffer = encode(call);
  if (!buffer.has_value()) {
    reject_(call, continuation, buffer.error());
    return;
  }

  if (call.expects_reply()) {
    if (!continuation) {
      continuation = [this, id = call.id](const Status& status, const nlohmann::json& result) {
        sink.on_response(id, status, result);
      };
    }
    if (const auto ec = registry.insert(call.id, std::move(continuation)); ec) {
      LOG_ERR("failed to register call id={}: {}", call.id, ec.message());
      return;
    }
  }

  TRACE("sending '{}' (id={})", call.method, call.id);
  if (const auto ec = connection.send(std::move(*buffer)); ec)
    registry.resolve(call.id, Status{ec});
}

// ---------------------------------------------------------------------------------- do_respond_

void RpcClient::Pimpl::do_respond_(int64_t id, expected<net::BufferType, error_code> buffer) {
  if (!buffer.has_value()) {
    sink.on_error(buffer.error(), format("reply to request id={} not sent", id));
    return;
  }

  if (!connection.is_connected()) {
    if (config.not_connected_policy == NotConnectedPolicy::REPORT)
      sink.on_error(make_error_code(ecode::not_connected),
                    format("reply to request id={} not sent", id));
    else
      TRACE("dropping reply to request id={}, connection is {}", id, str(connection.state()));
    return;
  }

  if (const auto ec = connection.send(std::move(*buffer)); ec)
    LOG_ERR("failed to send reply to request id={}: {}", id, ec.message());
}

// --------------------------------------------------------------------------------- do_teardown_

void RpcClient::Pimpl::do_teardown_() {
  connect_after_close = false;
  connection.close(config.close_code, "");
  connection.handle_closed();
  const auto count = registry.resolve_all(Status{ecode::connection_lost});
  TRACE("client torn down, {} pending calls abandoned", count);
}

// ------------------------------------------------------------------------------------ is_stale_

bool RpcClient::Pimpl::is_stale_(uint64_t generation, std::string_view event) const {
  if (generation == connection.generation()
      && connection.state() != net::ConnectionState::DISCONNECTED)
    return false;
  TRACE("discarding stale transport event '{}', generation {}", event, generation);
  return true;
}

// ---------------------------------------------------------------------------------- handle_open_

void RpcClient::Pimpl::handle_open_(uint64_t generation) {
  if (is_stale_(generation, "open"))
    return;
  if (connection.handle_open()) {
    INFO("connected to {}", endpoint.to_string());
    sink.on_open();
  }
}

// ------------------------------------------------------------------------------- handle_message_

void RpcClient::Pimpl::handle_message_(uint64_t generation, const string& text) {
  if (is_stale_(generation, "message"))
    return;

  auto message = decode(text);
  if (!message.has_value()) {
    sink.on_error(message.error(), format("undecodable message: {}", detail::abbreviate(text)));
    return;
  }

  const auto outcome = route(std::move(*message), registry, sink);
  TRACE("inbound message routed: {}", str(outcome));
}

// --------------------------------------------------------------------------------- handle_close_

void RpcClient::Pimpl::finish_connection_(uint16_t code, std::string_view reason, bool remote) {
  connection.handle_closed();
  registry.resolve_all(Status{ecode::connection_lost});
  sink.on_connection_closed(code, reason, remote);

  if (connect_after_close) {
    connect_after_close = false;
    do_connect_();
  }
}

void RpcClient::Pimpl::handle_close_(uint64_t generation, uint16_t code, const string& reason,
                                     bool remote) {
  if (is_stale_(generation, "close"))
    return;
  INFO("connection to {} closed, code={}, remote={}", endpoint.to_string(), code, remote);
  finish_connection_(code, reason, remote);
}

// --------------------------------------------------------------------------------- handle_error_

void RpcClient::Pimpl::handle_error_(uint64_t generation, net::WebsocketOperation op,
                                     error_code ec) {
  if (is_stale_(generation, "error"))
    return;

  const auto reported = (connection.state() == net::ConnectionState::CONNECTING)
                            ? make_error_code(ecode::connect_failure)
                            : make_error_code(ecode::connection_lost);
  WARN("connection to {} failed during {}: {}", endpoint.to_string(), str(op), ec.message());
  sink.on_error(reported, format("{} failed: {}", str(op), ec.message()));
  finish_connection_(net::k_close_abnormal, ec.message(), false);
}

// ------------------------------------------------------------------------------------- RpcClient

namespace {
net::Endpoint parse_url_or_throw(const string& url) {
  auto endpoint = net::parse_endpoint(url);
  if (!endpoint.has_value())
    throw std::runtime_error(format("invalid url '{}': {}", url, endpoint.error().message()));
  return std::move(*endpoint);
}
} // namespace

RpcClient::RpcClient(boost::asio::io_context& io_context, Config config,
                     net::TransportFactory transport_factory, RpcSink& sink) {
  auto endpoint = parse_url_or_throw(config.url);
  pimpl_ = make_shared<Pimpl>(io_context, std::move(config), std::move(endpoint),
                              std::move(transport_factory), sink);
}

RpcClient::~RpcClient() {
  pimpl_->sink.detach();
  pimpl_->dispatcher.post([core = pimpl_]() { core->do_teardown_(); });
}

void RpcClient::connect() {
  pimpl_->dispatcher.post([core = pimpl_]() { core->do_connect_(); });
}

void RpcClient::disconnect() {
  pimpl_->dispatcher.post([core = pimpl_]() { core->do_disconnect_(); });
}

bool RpcClient::is_connected() const noexcept { return pimpl_->connection.is_connected(); }

net::ConnectionState RpcClient::state() const noexcept { return pimpl_->connection.state(); }

void RpcClient::send(string method, Params params, int64_t id) {
  pimpl_->dispatcher.post(
      [core = pimpl_, call = Call{std::move(method), std::move(params), id}]() mutable {
        core->do_send_(std::move(call), Continuation{});
      });
}

void RpcClient::call(string method, Params params, int64_t id, Continuation continuation) {
  pimpl_->dispatcher.post([core = pimpl_, call = Call{std::move(method), std::move(params), id},
                           continuation = std::move(continuation)]() mutable {
    if (!continuation) {
      LOG_ERR("call '{}' (id={}) has no continuation, sending it without one", call.method,
              call.id);
    }
    core->do_send_(std::move(call), std::move(continuation));
  });
}

void RpcClient::respond(int64_t id, nlohmann::json result) {
  pimpl_->dispatcher.post([core = pimpl_, id, result = std::move(result)]() {
    core->do_respond_(id, encode_result(id, result));
  });
}

void RpcClient::respond_error(int64_t id, ErrorObject error) {
  pimpl_->dispatcher.post([core = pimpl_, id, error = std::move(error)]() {
    core->do_respond_(id, encode_error(id, error));
  });
}

uint64_t RpcClient::dispatch_sequence() const noexcept { return pimpl_->dispatcher.sequence(); }

std::size_t RpcClient::pending_calls() const noexcept { return pimpl_->registry.size(); }

} // namespace parley::rpc
