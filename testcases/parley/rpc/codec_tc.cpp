#include "stdinc.hpp"

#include "parley/rpc/codec.hpp"

#include <catch2/catch.hpp>

namespace parley::rpc::test {

namespace {
nlohmann::json encoded_json(const expected<net::BufferType, error_code>& buffer) {
  CATCH_REQUIRE(buffer.has_value());
  return nlohmann::json::parse(net::to_string_view(net::to_span_bytes(*buffer)));
}
} // namespace

CATCH_TEST_CASE("codec-encode", "[codec]") {
  CATCH_SECTION("encode-call") {
    const auto json = encoded_json(encode(Call{"joinRoom", {{"user", "alice"}, {"room", "r1"}}, 1}));
    CATCH_REQUIRE(json["jsonrpc"] == "2.0");
    CATCH_REQUIRE(json["method"] == "joinRoom");
    CATCH_REQUIRE(json["id"] == 1);
    CATCH_REQUIRE(json["params"] == nlohmann::json{{"user", "alice"}, {"room", "r1"}});
  }

  CATCH_SECTION("encode-param-types") {
    Params params{{"a", nullptr}, {"b", true}, {"c", int64_t(-7)}, {"d", 2.5}, {"e", "text"}};
    const auto json = encoded_json(encode(Call{"m", params, 3}));
    CATCH_REQUIRE(json["params"]["a"].is_null());
    CATCH_REQUIRE(json["params"]["b"] == true);
    CATCH_REQUIRE(json["params"]["c"] == -7);
    CATCH_REQUIRE(json["params"]["d"] == 2.5);
    CATCH_REQUIRE(json["params"]["e"] == "text");
  }

  CATCH_SECTION("encode-no-reply-and-no-params") {
    const auto json = encoded_json(encode(Call{"leaveRoom", {}, k_no_reply}));
    CATCH_REQUIRE(json.contains("id") == false);
    CATCH_REQUIRE(json.contains("params") == false);
    CATCH_REQUIRE(json["method"] == "leaveRoom");
  }

  CATCH_SECTION("encode-rejects") {
    CATCH_REQUIRE(encode(Call{"", {}, 1}).error() == ecode::argument_error);
    CATCH_REQUIRE(encode(Call{"m", {{"bad", "\xff\xfe"}}, 1}).error() == ecode::argument_error);
  }

  CATCH_SECTION("encode-replies") {
    const auto result = encoded_json(encode_result(9, nlohmann::json{{"ok", true}}));
    CATCH_REQUIRE(result["id"] == 9);
    CATCH_REQUIRE(result["result"]["ok"] == true);

    const auto error = encoded_json(encode_error(10, ErrorObject{k_method_not_found, "nope", {}}));
    CATCH_REQUIRE(error["id"] == 10);
    CATCH_REQUIRE(error["error"]["code"] == -32601);
    CATCH_REQUIRE(error["error"]["message"] == "nope");
    CATCH_REQUIRE(error["error"].contains("data") == false);
  }
}

CATCH_TEST_CASE("codec-decode", "[codec]") {
  CATCH_SECTION("decode-success-response") {
    auto message = decode(R"({"jsonrpc":"2.0","id":1,"result":{"sessionId":"abc"}})");
    CATCH_REQUIRE(message.has_value());
    const auto& response = std::get<Response>(*message);
    CATCH_REQUIRE(response.id == 1);
    CATCH_REQUIRE(response.is_success());
    CATCH_REQUIRE(response.result["sessionId"] == "abc");
  }

  CATCH_SECTION("decode-error-response") {
    auto message
        = decode(R"({"id":2,"error":{"code":104,"message":"Room closed","data":{"x":1}}})");
    CATCH_REQUIRE(message.has_value());
    const auto& response = std::get<Response>(*message);
    CATCH_REQUIRE(response.id == 2);
    CATCH_REQUIRE(!response.is_success());
    CATCH_REQUIRE(response.error->code == 104);
    CATCH_REQUIRE(response.error->message == "Room closed");
    CATCH_REQUIRE(response.error->data["x"] == 1);
  }

  CATCH_SECTION("decode-error-response-without-id") {
    for (auto text : {R"({"error":{"code":-32700,"message":"Parse error"}})",
                      R"({"id":null,"error":{"code":-32700,"message":"Parse error"}})"}) {
      auto message = decode(text);
      CATCH_REQUIRE(message.has_value());
      CATCH_REQUIRE(std::get<Response>(*message).id == k_no_reply);
    }
  }

  CATCH_SECTION("decode-notification") {
    auto message = decode(R"({"method":"participantJoined","params":{"id":"bob"}})");
    CATCH_REQUIRE(message.has_value());
    const auto& notification = std::get<Notification>(*message);
    CATCH_REQUIRE(notification.method == "participantJoined");
    CATCH_REQUIRE(notification.params["id"] == "bob");

    auto bare = decode(R"({"method":"roomClosed"})");
    CATCH_REQUIRE(bare.has_value());
    CATCH_REQUIRE(std::get<Notification>(*bare).params.is_null());
  }

  CATCH_SECTION("decode-request") {
    auto message = decode(R"({"jsonrpc":"2.0","method":"ping","id":77,"params":[1,2]})");
    CATCH_REQUIRE(message.has_value());
    const auto& request = std::get<Request>(*message);
    CATCH_REQUIRE(request.id == 77);
    CATCH_REQUIRE(request.method == "ping");
    CATCH_REQUIRE(request.params.is_array());
  }

  CATCH_SECTION("decode-rejects") {
    for (auto text : {"", "not json", "[1,2,3]", "42", R"({"id":1})", R"({"result":1})",
                      R"({"id":"one","result":1})", R"({"id":1.5,"result":1})",
                      R"({"id":1,"result":1,"error":{"code":1,"message":"x"}})",
                      R"({"id":1,"error":"bad"})", R"({"id":1,"error":{"message":"x"}})",
                      R"({"id":1,"error":{"code":1}})", R"({"method":5})",
                      R"({"method":"m","params":"scalar"})", R"({"id":18446744073709551615,"result":1})"}) {
      auto message = decode(text);
      CATCH_REQUIRE(!message.has_value());
      CATCH_REQUIRE(message.error() == ecode::decode_error);
    }
  }
}

} // namespace parley::rpc::test
