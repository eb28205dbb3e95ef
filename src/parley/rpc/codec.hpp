#pragma once

#include "message.hpp"

#include "parley/net/buffer.hpp"
#include "parley/utils.hpp"

namespace parley::rpc {

/**
 * @brief Encode a call as a JSON-RPC 2.0 envelope.
 *
 * `{"jsonrpc":"2.0","method":..,"params":{..},"id":..}`; "params" is omitted when
 * empty, and "id" is omitted for a call that expects no reply.
 *
 * @return `ecode::argument_error` if the call cannot be serialized, e.g., a string
 *         parameter that is not valid utf-8.
 */
expected<net::BufferType, error_code> encode(const Call& call);

/**
 * @brief Encode a successful reply to a server-initiated request.
 */
expected<net::BufferType, error_code> encode_result(int64_t id, const nlohmann::json& result);

/**
 * @brief Encode an error reply to a server-initiated request.
 */
expected<net::BufferType, error_code> encode_error(int64_t id, const ErrorObject& error);

/**
 * @brief Classify an inbound payload.
 *
 * + "method" and an integer "id" => Request
 * + "method" and no "id"         => Notification
 * + "result" and an integer "id" => Response (success)
 * + "error"                      => Response (error); a null or missing "id" becomes -1
 *
 * Anything else, including malformed JSON, is `ecode::decode_error`. Never throws
 * for bad input.
 */
expected<InboundMessage, error_code> decode(std::span<const std::byte> payload);

inline expected<InboundMessage, error_code> decode(std::string_view payload) {
  return decode(std::span<const std::byte>{reinterpret_cast<const std::byte*>(payload.data()),
                                           payload.size()});
}

/**
 * @brief Convert parameters to a JSON object.
 */
nlohmann::json to_json(const Params& params);

} // namespace parley::rpc
