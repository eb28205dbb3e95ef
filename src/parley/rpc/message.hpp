#pragma once

#include "parley/utils.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <variant>

namespace parley::rpc {

/// "No reply expected"; any negative id has the same meaning
constexpr int64_t k_no_reply = -1;

/// JSON-RPC 2.0 reserved error codes
constexpr int64_t k_parse_error = -32700;
constexpr int64_t k_invalid_request = -32600;
constexpr int64_t k_method_not_found = -32601;
constexpr int64_t k_invalid_params = -32602;
constexpr int64_t k_internal_error = -32603;

/**
 * @brief A scalar call parameter.
 */
using ParamValue = std::variant<std::nullptr_t, bool, int64_t, double, string>;

/**
 * @brief Named call parameters. An empty map is sent as "no parameters".
 */
using Params = std::map<string, ParamValue, std::less<>>;

// -------------------------------------------------------------------------------------------- Call

/**
 * @brief An outbound call; a negative `id` means no reply is expected.
 */
struct Call {
  string method{};
  Params params{};
  int64_t id{k_no_reply};

  bool expects_reply() const noexcept { return id >= 0; }
};

// ------------------------------------------------------------------------------------- ErrorObject

struct ErrorObject {
  int64_t code{0};
  string message{};
  nlohmann::json data{}; //!< null when absent
};

// ---------------------------------------------------------------------------------------- Response

struct Response {
  int64_t id{k_no_reply};              //!< -1 for an error response without an id
  nlohmann::json result{};             //!< set iff `error` is empty
  std::optional<ErrorObject> error{};

  bool is_success() const noexcept { return !error.has_value(); }
};

// ------------------------------------------------------------------------------------ Notification

struct Notification {
  string method{};
  nlohmann::json params{}; //!< null when absent
};

// ----------------------------------------------------------------------------------------- Request

/**
 * @brief A call initiated by the server.
 */
struct Request {
  int64_t id{0};
  string method{};
  nlohmann::json params{}; //!< null when absent
};

using InboundMessage = std::variant<Response, Notification, Request>;

} // namespace parley::rpc
