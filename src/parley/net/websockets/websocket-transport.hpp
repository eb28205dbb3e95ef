#pragma once

#include "parley/net/transport.hpp"

#include "parley/utils.hpp"

#include <chrono>

namespace boost::asio {
class io_context;
}

namespace parley::net {

// ------------------------------------------------------------------------ WebsocketTransportConfig

struct WebsocketTransportConfig {
  bool verify_peer = true;                                      //! Verify the server certificate
  string ca_file = {};                                          //! Extra CA bundle, pem format
  std::chrono::milliseconds handshake_timeout{30 * 1000};       //! For resolve/connect/handshake
  string user_agent = "parley";                                 //! Sent with the handshake
};

// ------------------------------------------------------------------------------ WebsocketTransport

/**
 * @brief A `Transport` over a Beast websocket, plain (`ws://`) or TLS (`wss://`).
 *
 * All socket operations run on a strand of the passed `io_context`, which must be
 * run by the caller. Destroying the transport cancels the socket, and guarantees
 * that no event is delivered to `events` afterwards.
 */
class WebsocketTransport final : public Transport {
public:
  using Config = WebsocketTransportConfig;

private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  /**
   * Exceptions
   * + std::bad_alloc
   */
  WebsocketTransport(boost::asio::io_context& io_context, TransportEvents& events,
                     Config config = {});
  WebsocketTransport(const WebsocketTransport&) = delete;
  WebsocketTransport(WebsocketTransport&&) = delete;
  ~WebsocketTransport() override;
  WebsocketTransport& operator=(const WebsocketTransport&) = delete;
  WebsocketTransport& operator=(WebsocketTransport&&) = delete;

  void open(const Endpoint& endpoint) override;
  void send_message(BufferType&& buffer) override;
  void close(uint16_t close_code, std::string_view reason) override;

  /**
   * @brief A `TransportFactory` producing `WebsocketTransport` instances.
   */
  static TransportFactory make_factory(boost::asio::io_context& io_context, Config config = {});
};

} // namespace parley::net
