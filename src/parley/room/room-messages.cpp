#include "room-messages.hpp"

namespace parley::room {

namespace {
std::optional<string> string_member(const nlohmann::json& object, std::string_view key) {
  if (!object.is_object())
    return std::nullopt;
  auto ii = object.find(string{key});
  if (ii == object.end() || !ii->is_string())
    return std::nullopt;
  return ii->get<string>();
}
} // namespace

RoomEvent room_event_from_method(std::string_view method) {
  static const unordered_map<std::string_view, RoomEvent> events = {
      {"participantJoined", RoomEvent::PARTICIPANT_JOINED},
      {"participantLeft", RoomEvent::PARTICIPANT_LEFT},
      {"participantEvicted", RoomEvent::PARTICIPANT_EVICTED},
      {"participantPublished", RoomEvent::PARTICIPANT_PUBLISHED},
      {"participantUnpublished", RoomEvent::PARTICIPANT_UNPUBLISHED},
      {"iceCandidate", RoomEvent::ICE_CANDIDATE},
      {"sendMessage", RoomEvent::SEND_MESSAGE},
      {"roomClosed", RoomEvent::ROOM_CLOSED},
      {"mediaError", RoomEvent::MEDIA_ERROR}};

  auto ii = events.find(method);
  return (ii == events.end()) ? RoomEvent::UNKNOWN : ii->second;
}

std::optional<string> RoomResponse::value(std::string_view key) const {
  return string_member(values, key);
}

RoomError RoomError::from_status(int64_t id, const rpc::Status& status) {
  return RoomError{id, status.code(), status.server_code(), string{status.message()},
                   status.data()};
}

std::optional<string> RoomNotification::param(std::string_view key) const {
  return string_member(params, key);
}

} // namespace parley::room
