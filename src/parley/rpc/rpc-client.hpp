#pragma once

#include "message.hpp"
#include "pending-call-registry.hpp"
#include "rpc-sink.hpp"

#include "parley/net/connection-state.hpp"
#include "parley/net/transport.hpp"
#include "parley/utils.hpp"

namespace boost::asio {
class io_context;
}

namespace parley::rpc {

// --------------------------------------------------------------------------------------- RpcClient

/**
 * @brief An asynchronous JSON-RPC 2.0 client over a single `Transport`.
 *
 * Every public method may be called from any thread, and returns without blocking
 * on the network. Each is posted, in call order, to one serialized dispatch context
 * (a strand of the passed `io_context`), where the connection state, the pending
 * calls and the transport are touched. Transport events join the same queue, so
 * two actions never interleave.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * boost::asio::io_context io_context;
 * RpcClient client{io_context, {.url = "wss://example.org/room"},
 *                  net::WebsocketTransport::make_factory(io_context), my_sink};
 * client.connect();
 * client.send("joinRoom", {{"user", "alice"}, {"room", "r1"}}, 1);
 * io_context.run();
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Destroying the client detaches the sink at once. The connection is then torn down
 * in the dispatch context, and pending continuations passed to `call` get
 * `ecode::connection_lost`. The `io_context` must outlive the client.
 */
class RpcClient {
public:
  /**
   * @brief What to do with a send while not CONNECTED.
   */
  enum class NotConnectedPolicy : int {
    DROP,  // Discard, with a trace log
    REPORT // Discard, and report ecode::not_connected through RpcSink::on_error
  };

  struct Config {
    string url = {};                                             //! ws:// or wss://
    NotConnectedPolicy not_connected_policy = NotConnectedPolicy::DROP;
    uint16_t close_code = net::k_close_normal;                    //! Sent on `disconnect`
  };

private:
  struct Pimpl;
  shared_ptr<Pimpl> pimpl_;

public:
  /**
   * Exceptions
   * + std::runtime_error if `config.url` is not a ws:// or wss:// url
   */
  RpcClient(boost::asio::io_context& io_context, Config config,
            net::TransportFactory transport_factory, RpcSink& sink);
  RpcClient(const RpcClient&) = delete;
  RpcClient(RpcClient&&) = delete;
  ~RpcClient();
  RpcClient& operator=(const RpcClient&) = delete;
  RpcClient& operator=(RpcClient&&) = delete;

  /**
   * @brief Open the connection.
   *
   * No-op when CONNECTING or CONNECTED. While CLOSING, the connect happens once the
   * close completes (unless `disconnect` is called first).
   */
  void connect();

  /**
   * @brief Close the connection. No-op when DISCONNECTED or CLOSING.
   */
  void disconnect();

  bool is_connected() const noexcept;
  net::ConnectionState state() const noexcept;

  /**
   * @brief Send a call.
   *
   * A negative `id` sends a call without expecting a reply. Otherwise, the outcome
   * arrives through `RpcSink::on_response(id, ...)`. A duplicate pending `id` is
   * reported through `RpcSink::on_error` with `ecode::duplicate_id`, and nothing is sent.
   */
  void send(string method, Params params, int64_t id);

  /**
   * @brief Send a call, and have `continuation` invoked exactly once with its outcome.
   *
   * `id` must not be negative. The continuation receives `ecode::not_connected` if the
   * call is dropped, `ecode::duplicate_id` if `id` is pending, `ecode::protocol_error`
   * for a server error, and `ecode::connection_lost` if the connection ends first.
   */
  void call(string method, Params params, int64_t id, Continuation continuation);

  /**
   * @brief Answer a server-initiated request.
   */
  void respond(int64_t id, nlohmann::json result);
  void respond_error(int64_t id, ErrorObject error);

  /**
   * @brief The number of actions the dispatch context has started so far.
   */
  uint64_t dispatch_sequence() const noexcept;

  /**
   * @brief The number of pending calls; only meaningful within the dispatch context,
   *        e.g., from a sink callback or a transport method.
   */
  std::size_t pending_calls() const noexcept;
};

} // namespace parley::rpc
