#include "router.hpp"

namespace parley::rpc {

namespace {
RouteOutcome route_response_(Response&& response, PendingCallRegistry& registry, RpcSink& sink) {
  const auto id = response.id;
  const bool resolved = response.is_success()
                            ? registry.resolve(id, Status{}, response.result)
                            : registry.resolve(id, Status::from_server(*response.error));
  if (resolved)
    return RouteOutcome::RESOLVED;

  const auto detail
      = response.is_success()
            ? format("unsolicited response, id={}", id)
            : format("unsolicited error response, id={}, code={}, message='{}'", id,
                     response.error->code, response.error->message);
  sink.on_error(make_error_code(ecode::invalid_data), detail);
  return RouteOutcome::STRAY;
}
} // namespace

RouteOutcome route(InboundMessage&& message, PendingCallRegistry& registry, RpcSink& sink) {
  if (auto* response = std::get_if<Response>(&message))
    return route_response_(std::move(*response), registry, sink);

  if (auto* notification = std::get_if<Notification>(&message)) {
    sink.on_notification(notification->method, notification->params);
    return RouteOutcome::NOTIFICATION;
  }

  auto& request = std::get<Request>(message);
  sink.on_request(request.id, request.method, request.params);
  return RouteOutcome::REQUEST;
}

} // namespace parley::rpc
