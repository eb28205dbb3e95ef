#include "websocket-transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/core/ignore_unused.hpp>

#include <deque>
#include <mutex>
#include <type_traits>

namespace parley::net::detail {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

/// Longest reason a websocket close frame can carry
constexpr std::size_t k_max_close_reason = 123;

// ------------------------------------------------------------------------------------- EventsRelay

/**
 * @brief Shared between the transport and its session, so that the session can
 *        outlive the transport without reporting to a dead `TransportEvents`.
 */
class EventsRelay {
private:
  std::mutex padlock_;
  TransportEvents* events_{nullptr};

public:
  explicit EventsRelay(TransportEvents& events) : events_{&events} {}

  void detach() {
    std::lock_guard lock{padlock_};
    events_ = nullptr;
  }

  template <typename F> void notify(const char* what, F&& f) {
    std::lock_guard lock{padlock_};
    if (events_ == nullptr)
      return;
    try {
      f(*events_);
    } catch (std::exception& e) {
      LOG_ERR("transport callback `{}` must not throw: {}", what, e.what());
    }
  }
};

// ------------------------------------------------------------------------------------- SessionBase

class SessionBase {
public:
  virtual ~SessionBase() = default;
  virtual void start(const Endpoint& endpoint) = 0;
  virtual void write(BufferType&& buffer) = 0;
  virtual void close(uint16_t close_code, std::string_view reason) = 0;
  virtual void cancel() = 0;
};

// ----------------------------------------------------------------------------------- ClientSession

template <typename NextLayer>
class ClientSession final : public SessionBase,
                            public std::enable_shared_from_this<ClientSession<NextLayer>> {
private:
  static constexpr bool k_is_tls = !std::is_same_v<NextLayer, beast::tcp_stream>;

  shared_ptr<EventsRelay> relay_;
  shared_ptr<asio::ssl::context> ssl_context_; //! tls only
  websocket::stream<NextLayer> ws_;
  asio::ip::tcp::resolver resolver_;
  beast::flat_buffer buffer_;
  std::deque<BufferType> write_queue_;
  Endpoint endpoint_;
  string host_;
  std::chrono::milliseconds timeout_;
  string user_agent_;
  bool verify_peer_{true};
  bool is_open_{false};
  bool close_requested_{false};
  bool finished_{false};

public:
  ClientSession(asio::io_context& ioc, shared_ptr<EventsRelay> relay,
                const WebsocketTransport::Config& config)
    requires(!k_is_tls)
      : relay_{std::move(relay)}, ws_{asio::make_strand(ioc)}, resolver_{ws_.get_executor()},
        timeout_{config.handshake_timeout}, user_agent_{config.user_agent},
        verify_peer_{config.verify_peer} {}

  ClientSession(asio::io_context& ioc, shared_ptr<EventsRelay> relay,
                const WebsocketTransport::Config& config, shared_ptr<asio::ssl::context> ctx)
    requires(k_is_tls)
      : relay_{std::move(relay)}, ssl_context_{std::move(ctx)},
        ws_{asio::make_strand(ioc), *ssl_context_}, resolver_{ws_.get_executor()},
        timeout_{config.handshake_timeout}, user_agent_{config.user_agent},
        verify_peer_{config.verify_peer} {}

  void start(const Endpoint& endpoint) override {
    asio::post(ws_.get_executor(), [self = this->shared_from_this(), endpoint]() {
      self->do_resolve_(endpoint);
    });
  }

  void write(BufferType&& buffer) override {
    asio::post(ws_.get_executor(),
               [self = this->shared_from_this(), buffer = std::move(buffer)]() mutable {
                 self->do_enqueue_(std::move(buffer));
               });
  }

  void close(uint16_t close_code, std::string_view reason) override {
    asio::post(ws_.get_executor(), [self = this->shared_from_this(), close_code,
                                    reason = string{reason.substr(0, k_max_close_reason)}]() {
      self->do_close_(close_code, reason);
    });
  }

  void cancel() override {
    asio::post(ws_.get_executor(), [self = this->shared_from_this()]() {
      self->finished_ = true;
      self->shutdown_socket_();
    });
  }

private:
  // @{ Connecting
  void do_resolve_(const Endpoint& endpoint) {
    if (finished_)
      return;
    endpoint_ = endpoint;
    resolver_.async_resolve(
        endpoint_.host, std::to_string(endpoint_.port),
        beast::bind_front_handler(&ClientSession::on_resolve_, this->shared_from_this()));
  }

  void on_resolve_(beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
    if (finished_)
      return;
    if (ec) {
      fail_(WebsocketOperation::CONNECT, ec);
      return;
    }

    beast::get_lowest_layer(ws_).expires_after(timeout_);
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&ClientSession::on_connect_, this->shared_from_this()));
  }

  void on_connect_(beast::error_code ec, asio::ip::tcp::resolver::results_type::endpoint_type ep) {
    if (finished_)
      return;
    if (ec) {
      fail_(WebsocketOperation::CONNECT, ec);
      return;
    }

    // This will provide the value of the Host HTTP header during the WebSocket handshake.
    // See https://tools.ietf.org/html/rfc7230#section-5.4
    host_ = endpoint_.host + ':' + std::to_string(ep.port());

    if constexpr (k_is_tls) {
      // Set SNI Hostname (many hosts need this to handshake successfully)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
      const bool set_tls_successful =
          SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), endpoint_.host.c_str());
#pragma GCC diagnostic pop
      if (!set_tls_successful) {
        ec = beast::error_code{static_cast<int>(::ERR_get_error()),
                               asio::error::get_ssl_category()};
        fail_(WebsocketOperation::HANDSHAKE, ec);
        return;
      }

      if (verify_peer_) {
        ws_.next_layer().set_verify_callback(asio::ssl::host_name_verification(endpoint_.host),
                                             ec);
        if (ec) {
          fail_(WebsocketOperation::HANDSHAKE, ec);
          return;
        }
      }

      ws_.next_layer().async_handshake(
          asio::ssl::stream_base::client,
          beast::bind_front_handler(&ClientSession::on_tls_handshake_, this->shared_from_this()));
    } else {
      do_websocket_handshake_();
    }
  }

  void on_tls_handshake_(beast::error_code ec) {
    if (finished_)
      return;
    if (ec) {
      fail_(WebsocketOperation::HANDSHAKE, ec);
      return;
    }
    do_websocket_handshake_();
  }

  void do_websocket_handshake_() {
    // Turn off the timeout on the tcp_stream, because
    // the websocket stream has its own timeout system.
    beast::get_lowest_layer(ws_).expires_never();

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator(
        [user_agent = user_agent_](websocket::request_type& req) {
          req.set(beast::http::field::user_agent, user_agent);
        }));

    ws_.async_handshake(
        host_, endpoint_.path,
        beast::bind_front_handler(&ClientSession::on_handshake_, this->shared_from_this()));
  }

  void on_handshake_(beast::error_code ec) {
    if (finished_)
      return;
    if (ec) {
      fail_(WebsocketOperation::HANDSHAKE, ec);
      return;
    }

    ws_.text(true);
    is_open_ = true;
    TRACE("websocket open: {}", endpoint_.to_string());
    relay_->notify("on_open", [](TransportEvents& events) { events.on_open(); });

    do_read_();
    if (!write_queue_.empty())
      do_write_();
  }
  // @}

  // @{ Reading
  void do_read_() {
    ws_.async_read(buffer_,
                   beast::bind_front_handler(&ClientSession::on_read_, this->shared_from_this()));
  }

  void on_read_(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);
    if (finished_)
      return;

    // This indicates that the session was closed
    if (ec == websocket::error::closed) {
      if (!close_requested_)
        finish_close_(true);
      return;
    }

    if (ec) {
      if (close_requested_ && ec == asio::error::operation_aborted)
        return;
      fail_(WebsocketOperation::READ, ec);
      return;
    }

    const auto data = buffer_.data();
    const auto payload =
        std::span<const std::byte>{static_cast<const std::byte*>(data.data()), data.size()};
    relay_->notify("on_message", [payload](TransportEvents& events) { events.on_message(payload); });

    buffer_.consume(buffer_.size());
    do_read_();
  }
  // @}

  // @{ Writing
  void do_enqueue_(BufferType&& buffer) {
    if (finished_ || close_requested_) {
      TRACE("dropping {} byte message, websocket is closing", buffer.size());
      return;
    }
    write_queue_.push_back(std::move(buffer));
    if (is_open_ && write_queue_.size() == 1)
      do_write_();
  }

  void do_write_() {
    const auto& front = write_queue_.front();
    ws_.async_write(asio::buffer(front.data(), front.size()),
                    beast::bind_front_handler(&ClientSession::on_write_, this->shared_from_this()));
  }

  void on_write_(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);
    if (finished_)
      return;
    if (ec) {
      if (!(close_requested_ && ec == asio::error::operation_aborted))
        fail_(WebsocketOperation::WRITE, ec);
      return;
    }

    write_queue_.pop_front();
    if (!write_queue_.empty())
      do_write_();
  }
  // @}

  // @{ Closing
  void do_close_(uint16_t close_code, const string& reason) {
    if (finished_ || close_requested_)
      return;
    close_requested_ = true;

    if (!is_open_) {
      // Still connecting: abandon the attempt, there is no one to say goodbye to
      shutdown_socket_();
      finished_ = true;
      relay_->notify("on_close", [close_code, &reason](TransportEvents& events) {
        events.on_close(close_code, reason, false);
      });
      return;
    }

    ws_.async_close(
        websocket::close_reason{static_cast<websocket::close_code>(close_code),
                                beast::string_view{reason.data(), reason.size()}},
        beast::bind_front_handler(&ClientSession::on_close_, this->shared_from_this()));
  }

  void on_close_(beast::error_code ec) {
    if (finished_)
      return;
    if (ec) {
      fail_(WebsocketOperation::CLOSE, ec);
      return;
    }
    finish_close_(false);
  }

  void finish_close_(bool remote) {
    finished_ = true;
    is_open_ = false;
    const uint16_t code = ws_.reason().code;
    const auto reason = string{ws_.reason().reason.data(), ws_.reason().reason.size()};
    TRACE("websocket closed, code={}, reason='{}', remote={}", code, reason, remote);
    relay_->notify("on_close", [code, &reason, remote](TransportEvents& events) {
      events.on_close(code, reason, remote);
    });
  }
  // @}

  void fail_(WebsocketOperation operation, beast::error_code ec) {
    finished_ = true;
    is_open_ = false;
    TRACE("websocket error on op={}: {}", str(operation), ec.message());
    shutdown_socket_();
    relay_->notify("on_error", [operation, ec](TransportEvents& events) {
      events.on_error(operation, std::error_code{ec});
    });
  }

  void shutdown_socket_() {
    beast::error_code ignored;
    resolver_.cancel();
    beast::get_lowest_layer(ws_).socket().close(ignored);
  }
};

// -------------------------------------------------------------------------------- make_tls_context

static shared_ptr<asio::ssl::context> make_tls_context(const WebsocketTransport::Config& config) {
  auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tlsv12_client);
  beast::error_code ec;

  ctx->set_verify_mode(config.verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none, ec);
  if (ec)
    WARN("failed to set tls verify mode: {}", ec.message());

  if (config.verify_peer) {
    ctx->set_default_verify_paths(ec);
    if (ec)
      WARN("failed to load default tls verify paths: {}", ec.message());
    if (!config.ca_file.empty()) {
      ctx->load_verify_file(config.ca_file, ec);
      if (ec)
        WARN("failed to load ca file '{}': {}", config.ca_file, ec.message());
    }
  }

  return ctx;
}

} // namespace parley::net::detail

namespace parley::net {

namespace beast = boost::beast;

// ------------------------------------------------------------------------------------------- Pimpl

struct WebsocketTransport::Pimpl {
  boost::asio::io_context& io_context;
  Config config;
  shared_ptr<detail::EventsRelay> relay;
  shared_ptr<detail::SessionBase> session = nullptr;

  Pimpl(boost::asio::io_context& io_context_, TransportEvents& events, Config config_)
      : io_context{io_context_}, config{std::move(config_)},
        relay{std::make_shared<detail::EventsRelay>(events)} {}
};

// ------------------------------------------------------------------------------------ Construction

WebsocketTransport::WebsocketTransport(boost::asio::io_context& io_context,
                                       TransportEvents& events, Config config)
    : pimpl_{std::make_unique<Pimpl>(io_context, events, std::move(config))} {}

WebsocketTransport::~WebsocketTransport() {
  pimpl_->relay->detach();
  if (pimpl_->session)
    pimpl_->session->cancel();
}

// ---------------------------------------------------------------------------------------- Methods

void WebsocketTransport::open(const Endpoint& endpoint) {
  if (pimpl_->session != nullptr) {
    WARN("websocket transport to {} is single use", endpoint.to_string());
    return;
  }

  if (endpoint.secure) {
    using SessionType = detail::ClientSession<beast::ssl_stream<beast::tcp_stream>>;
    pimpl_->session = std::make_shared<SessionType>(pimpl_->io_context, pimpl_->relay,
                                                    pimpl_->config,
                                                    detail::make_tls_context(pimpl_->config));
  } else {
    using SessionType = detail::ClientSession<beast::tcp_stream>;
    pimpl_->session =
        std::make_shared<SessionType>(pimpl_->io_context, pimpl_->relay, pimpl_->config);
  }

  pimpl_->session->start(endpoint);
}

void WebsocketTransport::send_message(BufferType&& buffer) {
  if (pimpl_->session == nullptr) {
    WARN("dropping {} byte message, websocket transport was never opened", buffer.size());
    return;
  }
  pimpl_->session->write(std::move(buffer));
}

void WebsocketTransport::close(uint16_t close_code, std::string_view reason) {
  if (pimpl_->session != nullptr)
    pimpl_->session->close(close_code, reason);
}

TransportFactory WebsocketTransport::make_factory(boost::asio::io_context& io_context,
                                                  Config config) {
  return [&io_context, config = std::move(config)](TransportEvents& events) {
    return std::make_unique<WebsocketTransport>(io_context, events, config);
  };
}

} // namespace parley::net
