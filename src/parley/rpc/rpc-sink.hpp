#pragma once

#include "status.hpp"

#include "parley/utils.hpp"

namespace parley::rpc {

// ----------------------------------------------------------------------------------------- RpcSink

/**
 * @brief What an `RpcClient` reports upward.
 *
 * Every callback runs in the client's dispatch context, one at a time, in the
 * order the underlying events happened. A callback may call back into the client
 * (send, call, disconnect...), but must not destroy it.
 */
class RpcSink {
public:
  virtual ~RpcSink() = default;

  /**
   * @brief The connection is open.
   */
  virtual void on_open() {}

  /**
   * @brief The outcome of a call made with `RpcClient::send`.
   *
   * Calls still pending when the connection ends are reported here with
   * `ecode::connection_lost`.
   */
  virtual void on_response(int64_t id, const Status& status, const nlohmann::json& result) = 0;

  virtual void on_notification(std::string_view method, const nlohmann::json& params) = 0;

  /**
   * @brief The server called us. Answer with `RpcClient::respond` or `respond_error`.
   */
  virtual void on_request(int64_t id, std::string_view method, const nlohmann::json& params) {}

  /**
   * @brief The connection is now DISCONNECTED.
   * @param remote true iff the server initiated the close
   */
  virtual void on_connection_closed(uint16_t code, std::string_view reason, bool remote) = 0;

  /**
   * @brief Diagnostics: connect failures, transport errors, undecodable or
   *        unsolicited messages, and rejected sends.
   */
  virtual void on_error(std::error_code ec, std::string_view detail) {
    WARN("rpc error: {}: {}", ec.message(), detail);
  }
};

} // namespace parley::rpc
