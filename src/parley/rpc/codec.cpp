#include "codec.hpp"

namespace parley::rpc {

namespace {
constexpr const char* k_jsonrpc_version = "2.0";

nlohmann::json param_to_json(const ParamValue& value) {
  return std::visit([](const auto& x) -> nlohmann::json { return x; }, value);
}

expected<net::BufferType, error_code> dump_(const nlohmann::json& envelope) {
  try {
    return net::make_send_buffer(envelope.dump());
  } catch (nlohmann::json::exception& e) {
    WARN("failed to serialize outbound message: {}", e.what());
    return make_unexpected(make_error_code(ecode::argument_error));
  }
}

expected<InboundMessage, error_code> decode_error_(std::string_view what) {
  TRACE("decode error: {}", what);
  return make_unexpected(make_error_code(ecode::decode_error));
}

// Reads an integer id that fits int64_t
std::optional<int64_t> read_id_(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    const auto x = value.get<uint64_t>();
    if (x > uint64_t(std::numeric_limits<int64_t>::max()))
      return std::nullopt;
    return int64_t(x);
  }
  if (value.is_number_integer())
    return value.get<int64_t>();
  return std::nullopt;
}

nlohmann::json member_or_null_(const nlohmann::json& object, const char* key) {
  auto ii = object.find(key);
  return (ii == object.end()) ? nlohmann::json{} : *ii;
}

} // namespace

// ----------------------------------------------------------------------------------------- to_json

nlohmann::json to_json(const Params& params) {
  auto object = nlohmann::json::object();
  for (const auto& [key, value] : params)
    object[key] = param_to_json(value);
  return object;
}

// ------------------------------------------------------------------------------------------ encode

expected<net::BufferType, error_code> encode(const Call& call) {
  if (call.method.empty())
    return make_unexpected(make_error_code(ecode::argument_error));

  nlohmann::json envelope = {{"jsonrpc", k_jsonrpc_version}, {"method", call.method}};
  if (!call.params.empty())
    envelope["params"] = to_json(call.params);
  if (call.expects_reply())
    envelope["id"] = call.id;
  return dump_(envelope);
}

expected<net::BufferType, error_code> encode_result(int64_t id, const nlohmann::json& result) {
  return dump_({{"jsonrpc", k_jsonrpc_version}, {"id", id}, {"result", result}});
}

expected<net::BufferType, error_code> encode_error(int64_t id, const ErrorObject& error) {
  nlohmann::json error_object = {{"code", error.code}, {"message", error.message}};
  if (!error.data.is_null())
    error_object["data"] = error.data;
  return dump_({{"jsonrpc", k_jsonrpc_version}, {"id", id}, {"error", error_object}});
}

// ------------------------------------------------------------------------------------------ decode

expected<InboundMessage, error_code> decode(std::span<const std::byte> payload) {
  const auto text = net::to_string_view(payload);
  const auto envelope = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);

  if (envelope.is_discarded())
    return decode_error_("malformed json");
  if (!envelope.is_object())
    return decode_error_("envelope is not an object");

  const auto id_ii = envelope.find("id");
  const bool has_id = (id_ii != envelope.end()) && !id_ii->is_null();
  std::optional<int64_t> id;
  if (has_id) {
    id = read_id_(*id_ii);
    if (!id.has_value())
      return decode_error_("id is not an integer");
  }

  // ---- Request or Notification
  if (auto method_ii = envelope.find("method"); method_ii != envelope.end()) {
    if (!method_ii->is_string())
      return decode_error_("method is not a string");
    auto params = member_or_null_(envelope, "params");
    if (!params.is_null() && !params.is_object() && !params.is_array())
      return decode_error_("params is neither an object nor an array");
    if (id.has_value())
      return Request{*id, method_ii->get<string>(), std::move(params)};
    return Notification{method_ii->get<string>(), std::move(params)};
  }

  const auto result_ii = envelope.find("result");
  const auto error_ii = envelope.find("error");
  const bool has_result = result_ii != envelope.end();
  const bool has_error = error_ii != envelope.end();

  if (has_result && has_error)
    return decode_error_("both result and error present");

  // ---- Response (success)
  if (has_result) {
    if (!id.has_value())
      return decode_error_("result without an id");
    return Response{*id, *result_ii, std::nullopt};
  }

  // ---- Response (error)
  if (has_error) {
    if (!error_ii->is_object())
      return decode_error_("error is not an object");
    auto code = read_id_(member_or_null_(*error_ii, "code"));
    if (!code.has_value())
      return decode_error_("error code is not an integer");

    const auto message = member_or_null_(*error_ii, "message");
    if (!message.is_string())
      return decode_error_("error message is not a string");

    ErrorObject error;
    error.code = *code;
    error.message = message.get<string>();
    error.data = member_or_null_(*error_ii, "data");
    return Response{id.value_or(k_no_reply), nlohmann::json{}, std::move(error)};
  }

  return decode_error_("neither a call nor a response");
}

} // namespace parley::rpc
