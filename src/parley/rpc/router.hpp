#pragma once

#include "message.hpp"
#include "pending-call-registry.hpp"
#include "rpc-sink.hpp"

namespace parley::rpc {

enum class RouteOutcome : int {
  RESOLVED,     // A response that completed a pending call
  STRAY,        // A response that matched no pending call
  NOTIFICATION, // Forwarded to RpcSink::on_notification
  REQUEST       // Forwarded to RpcSink::on_request
};

constexpr std::string_view str(RouteOutcome outcome) {
#define CASE(x)                                                                                    \
  case RouteOutcome::x:                                                                            \
    return #x
  switch (outcome) {
    CASE(RESOLVED);
    CASE(STRAY);
    CASE(NOTIFICATION);
    CASE(REQUEST);
  }
#undef CASE
  return "<unknown case>";
}

/**
 * @brief Deliver a decoded inbound message.
 *
 * A response resolves its pending call; one that matches no pending call goes
 * to `sink.on_error` with `ecode::invalid_data`. Must run in the dispatch context
 * that owns `registry`.
 */
RouteOutcome route(InboundMessage&& message, PendingCallRegistry& registry, RpcSink& sink);

} // namespace parley::rpc
