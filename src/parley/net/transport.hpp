#pragma once

#include "parley/net/buffer.hpp"
#include "parley/net/endpoint.hpp"

#include "parley/utils.hpp"

namespace parley::net {

enum class WebsocketOperation : int {
  CONNECT,   // A (client) is initiating a connection
  HANDSHAKE, // tls or websocket handshake
  READ,      // During read operation
  WRITE,     // During a write operation
  CLOSE      // The websocket stream is being closed
};

constexpr std::string_view str(WebsocketOperation op) {
#define CASE(x)                                                                                    \
  case WebsocketOperation::x:                                                                      \
    return #x
  switch (op) {
    CASE(CONNECT);
    CASE(HANDSHAKE);
    CASE(READ);
    CASE(WRITE);
    CASE(CLOSE);
  }
#undef CASE
  return "<unknown case>";
}

/// Websocket close code for a normal closure, see rfc6455 section 7.4.1
constexpr uint16_t k_close_normal = 1000;

/// Reported (never sent) when the connection dropped without a close frame
constexpr uint16_t k_close_abnormal = 1006;

// --------------------------------------------------------------------------------- TransportEvents

/**
 * @brief The four events a transport delivers upward.
 *
 * Events may be delivered from the transport's own thread. A transport delivers
 * at most one of `on_close` or `on_error` for the end of a connection, and nothing
 * after it.
 */
class TransportEvents {
public:
  virtual ~TransportEvents() = default;

  /**
   * @brief The connection is open, and `send_message` may be called.
   */
  virtual void on_open() = 0;

  /**
   * @brief A complete message was received.
   * The memory behind `payload` is reused after this call returns.
   */
  virtual void on_message(std::span<const std::byte> payload) = 0;

  /**
   * @brief The connection finished a close handshake.
   * @param remote true iff the other end initiated the close
   */
  virtual void on_close(uint16_t code, std::string_view reason, bool remote) = 0;

  /**
   * @brief The connection failed, and no further events follow.
   */
  virtual void on_error(WebsocketOperation operation, std::error_code ec) = 0;
};

// --------------------------------------------------------------------------------------- Transport

/**
 * @brief A duplex, message oriented connection.
 *
 * Only ever used by a single `Connection`, which calls it from one logical
 * thread of control. Implementations must not deliver events synchronously
 * from within `open`, `send_message` or `close`.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * @brief Begin opening the connection; completion is reported through `on_open`
   *        or `on_error`.
   */
  virtual void open(const Endpoint& endpoint) = 0;

  /**
   * @brief Queue a message for sending.
   */
  virtual void send_message(BufferType&& buffer) = 0;

  /**
   * @brief Begin a close handshake; completion is reported through `on_close`
   *        or `on_error`.
   */
  virtual void close(uint16_t close_code, std::string_view reason) = 0;
};

/**
 * @brief Creates a transport that will report to `events`. The events object outlives
 *        the transport.
 */
using TransportFactory = std::function<unique_ptr<Transport>(TransportEvents& events)>;

} // namespace parley::net
