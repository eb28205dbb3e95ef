#include "stdinc.hpp"

#include "parley/room/room-api.hpp"

#include "parley/test-transport.hpp"

#include <catch2/catch.hpp>

namespace parley::room::test {

using parley::test::drain;
using parley::test::make_test_factory;
using parley::test::TransportScript;

namespace {
struct RecordingListener final : public RoomListener {
  vector<RoomResponse> responses;
  vector<RoomError> errors;
  vector<RoomNotification> notifications;
  std::size_t connected = 0;
  std::size_t disconnected = 0;

  void on_room_response(const RoomResponse& response) override { responses.push_back(response); }
  void on_room_error(const RoomError& error) override { errors.push_back(error); }
  void on_room_notification(const RoomNotification& notification) override {
    notifications.push_back(notification);
  }
  void on_room_connected() override { ++connected; }
  void on_room_disconnected(uint16_t, std::string_view, bool) override { ++disconnected; }
};

struct RoomHarness {
  boost::asio::io_context io_context;
  shared_ptr<TransportScript> script = make_shared<TransportScript>();
  RecordingListener listener;
  RoomApi api{io_context, {.url = "wss://room.example.org/room"}, make_test_factory(script),
              listener};

  RoomHarness() {
    api.connect_websocket();
    drain(io_context);
    script->emit_open();
    drain(io_context);
  }

  nlohmann::json last_sent() {
    drain(io_context);
    const auto sent = script->sent_messages();
    CATCH_REQUIRE(!sent.empty());
    return nlohmann::json::parse(sent.back());
  }

  void receive(std::string_view text) {
    script->emit_message(text);
    drain(io_context);
  }
};
} // namespace

CATCH_TEST_CASE("room-api-requests", "[room-api]") {
  RoomHarness h;
  CATCH_REQUIRE(h.api.is_websocket_connected());
  CATCH_REQUIRE(h.listener.connected == 1);

  CATCH_SECTION("join-and-leave") {
    h.api.send_join_room("alice", "r1", 1);
    auto join = h.last_sent();
    CATCH_REQUIRE(join["method"] == "joinRoom");
    CATCH_REQUIRE(join["params"] == nlohmann::json{{"user", "alice"}, {"room", "r1"}});
    CATCH_REQUIRE(join["id"] == 1);

    h.api.send_leave_room(2);
    auto leave = h.last_sent();
    CATCH_REQUIRE(leave["method"] == "leaveRoom");
    CATCH_REQUIRE(leave.contains("params") == false);
    CATCH_REQUIRE(leave["id"] == 2);
  }

  CATCH_SECTION("media") {
    h.api.send_publish_video("v=0 offer", true, 3);
    auto publish = h.last_sent();
    CATCH_REQUIRE(publish["method"] == "publishVideo");
    CATCH_REQUIRE(publish["params"]["sdpOffer"] == "v=0 offer");
    CATCH_REQUIRE(publish["params"]["doLoopback"] == true);

    h.api.send_unpublish_video(4);
    CATCH_REQUIRE(h.last_sent()["method"] == "unpublishVideo");

    h.api.send_receive_video_from("bob_webcam", "v=0 offer", 5);
    auto receive = h.last_sent();
    CATCH_REQUIRE(receive["method"] == "receiveVideoFrom");
    CATCH_REQUIRE(receive["params"]["sender"] == "bob_webcam");

    h.api.send_unsubscribe_from_video("bob", "webcam", 6);
    auto unsubscribe = h.last_sent();
    CATCH_REQUIRE(unsubscribe["method"] == "unsubscribeFromVideo");
    CATCH_REQUIRE(unsubscribe["params"] == nlohmann::json{{"sender", "bob_webcam"}});
  }

  CATCH_SECTION("ice-candidate-expects-no-reply") {
    h.api.send_on_ice_candidate("bob", "candidate:1 1 UDP 2122", "audio", 0);
    auto candidate = h.last_sent();
    CATCH_REQUIRE(candidate["method"] == "onIceCandidate");
    CATCH_REQUIRE(candidate.contains("id") == false);
    CATCH_REQUIRE(candidate["params"]["endpointName"] == "bob");
    CATCH_REQUIRE(candidate["params"]["candidate"] == "candidate:1 1 UDP 2122");
    CATCH_REQUIRE(candidate["params"]["sdpMid"] == "audio");
    CATCH_REQUIRE(candidate["params"]["sdpMLineIndex"] == 0);
  }

  CATCH_SECTION("chat-message") {
    h.api.send_message("r1", "alice", "hello", 7);
    auto message = h.last_sent();
    CATCH_REQUIRE(message["method"] == "sendMessage");
    CATCH_REQUIRE(message["params"]
                  == nlohmann::json{
                      {"message", "hello"}, {"userMessage", "alice"}, {"roomMessage", "r1"}});
  }

  CATCH_SECTION("custom-request") {
    CATCH_REQUIRE(!h.api.send_custom_request({"a", "b"}, {"1", "2"}, 8));
    auto custom = h.last_sent();
    CATCH_REQUIRE(custom["method"] == "customRequest");
    CATCH_REQUIRE(custom["params"] == nlohmann::json{{"a", "1"}, {"b", "2"}});

    CATCH_REQUIRE(h.api.send_custom_request({"a", "b"}, {"1"}, 9) == ecode::argument_error);
    drain(h.io_context);
    CATCH_REQUIRE(h.script->sent_messages().size() == 1);
  }
}

CATCH_TEST_CASE("room-api-events", "[room-api]") {
  RoomHarness h;

  CATCH_SECTION("responses-and-errors") {
    h.api.send_join_room("alice", "r1", 1);
    h.api.send_publish_video("offer", false, 2);
    drain(h.io_context);

    h.receive(R"({"id":1,"result":{"sessionId":"s-42","value":[]}})");
    h.receive(R"({"id":2,"error":{"code":104,"message":"not in room"}})");

    CATCH_REQUIRE(h.listener.responses.size() == 1);
    CATCH_REQUIRE(h.listener.responses[0].id == 1);
    CATCH_REQUIRE(h.listener.responses[0].value("sessionId") == "s-42");
    CATCH_REQUIRE(!h.listener.responses[0].value("value").has_value());

    CATCH_REQUIRE(h.listener.errors.size() == 1);
    CATCH_REQUIRE(h.listener.errors[0].id == 2);
    CATCH_REQUIRE(h.listener.errors[0].code == ecode::protocol_error);
    CATCH_REQUIRE(h.listener.errors[0].server_code == 104);
    CATCH_REQUIRE(h.listener.errors[0].message == "not in room");
  }

  CATCH_SECTION("notifications") {
    h.receive(R"({"method":"participantJoined","params":{"id":"bob"}})");
    h.receive(R"({"method":"somethingNew"})");
    CATCH_REQUIRE(h.listener.notifications.size() == 2);
    CATCH_REQUIRE(h.listener.notifications[0].event() == RoomEvent::PARTICIPANT_JOINED);
    CATCH_REQUIRE(h.listener.notifications[0].param("id") == "bob");
    CATCH_REQUIRE(h.listener.notifications[1].event() == RoomEvent::UNKNOWN);
    CATCH_REQUIRE(!h.listener.notifications[1].param("id").has_value());
  }

  CATCH_SECTION("server-requests-are-refused") {
    h.receive(R"({"method":"whoAreYou","id":12})");
    auto reply = h.last_sent();
    CATCH_REQUIRE(reply["id"] == 12);
    CATCH_REQUIRE(reply["error"]["code"] == rpc::k_method_not_found);
  }

  CATCH_SECTION("disconnect-reports-pending-as-errors") {
    h.api.send_join_room("alice", "r1", 1);
    drain(h.io_context);
    h.api.disconnect_websocket();
    drain(h.io_context);
    h.script->emit_close();
    drain(h.io_context);

    CATCH_REQUIRE(!h.api.is_websocket_connected());
    CATCH_REQUIRE(h.listener.disconnected == 1);
    CATCH_REQUIRE(h.listener.errors.size() == 1);
    CATCH_REQUIRE(h.listener.errors[0].id == 1);
    CATCH_REQUIRE(h.listener.errors[0].code == ecode::connection_lost);
  }
}

CATCH_TEST_CASE("room-events", "[room-api]") {
  CATCH_REQUIRE(room_event_from_method("participantLeft") == RoomEvent::PARTICIPANT_LEFT);
  CATCH_REQUIRE(room_event_from_method("iceCandidate") == RoomEvent::ICE_CANDIDATE);
  CATCH_REQUIRE(room_event_from_method("roomClosed") == RoomEvent::ROOM_CLOSED);
  CATCH_REQUIRE(room_event_from_method("") == RoomEvent::UNKNOWN);
  CATCH_REQUIRE(str(RoomEvent::MEDIA_ERROR) == "MEDIA_ERROR");
}

} // namespace parley::room::test
