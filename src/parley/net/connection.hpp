#pragma once

#include "connection-state.hpp"
#include "transport.hpp"

#include "parley/utils.hpp"

#include <atomic>

namespace parley::net {

// -------------------------------------------------------------------------------------- Connection

/**
 * @brief The connection lifecycle state machine.
 *
 * ~~~
 *  DISCONNECTED --open--> CONNECTING --handle_open--> CONNECTED
 *       ^                     |                           |
 *       |                   close                       close
 *       |                     v                           v
 *       +--handle_closed-- CLOSING <----------------------+
 * ~~~
 * `handle_closed` (transport closed or failed) returns any state to DISCONNECTED.
 *
 * The Connection exclusively owns the transport while it is not DISCONNECTED.
 * Every method except `state`, `is_connected` and `generation` must be called from
 * the single dispatch context that owns the Connection. `state` and `is_connected`
 * may be called from any thread.
 *
 * Each `open` starts a new generation. Events from a transport created by an earlier
 * generation are stale, and the owner should discard them.
 */
class Connection {
public:
  /**
   * @brief Creates the events sink for the transport of generation `generation`.
   */
  using EventsFactory = std::function<unique_ptr<TransportEvents>(uint64_t generation)>;

private:
  TransportFactory transport_factory_;
  std::atomic<ConnectionState> state_{ConnectionState::DISCONNECTED};
  std::atomic<uint64_t> generation_{0};
  Endpoint endpoint_{};

  // Destruction order matters: the transport goes before the events it reports to
  unique_ptr<TransportEvents> events_{};
  unique_ptr<Transport> transport_{};

  void set_state_(ConnectionState state);
  void release_transport_();

public:
  explicit Connection(TransportFactory transport_factory);
  Connection(const Connection&) = delete;
  Connection(Connection&&) = delete;
  ~Connection();
  Connection& operator=(const Connection&) = delete;
  Connection& operator=(Connection&&) = delete;

  ConnectionState state() const noexcept { return state_.load(std::memory_order_acquire); }
  bool is_connected() const noexcept { return state() == ConnectionState::CONNECTED; }
  uint64_t generation() const noexcept { return generation_.load(std::memory_order_acquire); }
  const Endpoint& endpoint() const noexcept { return endpoint_; }

  /**
   * @brief Start opening a transport to `endpoint`.
   *
   * No-op when CONNECTING, CONNECTED or CLOSING (the caller decides whether to defer).
   * @return `ecode::connect_failure` if the transport could not be created; the
   *         state stays DISCONNECTED.
   */
  error_code open(const Endpoint& endpoint, const EventsFactory& make_events);

  /**
   * @brief Ask the transport to close.
   * @return false iff this was a no-op, i.e., the state was DISCONNECTED or CLOSING.
   */
  bool close(uint16_t close_code = k_close_normal, std::string_view reason = "");

  /**
   * @brief The transport reported that it is open.
   * @return true iff the state moved to CONNECTED. An open that races with a `close`
   *         leaves the state CLOSING.
   */
  bool handle_open();

  /**
   * @brief The transport closed or failed; the transport is released.
   * @return the state before the transition.
   */
  ConnectionState handle_closed();

  /**
   * @brief Transmit `buffer`.
   * @return `ecode::not_connected` unless CONNECTED, in which case the buffer is dropped.
   */
  error_code send(BufferType&& buffer);
};

} // namespace parley::net
