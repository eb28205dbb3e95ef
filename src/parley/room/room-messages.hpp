#pragma once

#include "parley/rpc/status.hpp"
#include "parley/utils.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace parley::room {

/**
 * @brief The notifications a room server sends.
 */
enum class RoomEvent : int {
  PARTICIPANT_JOINED,
  PARTICIPANT_LEFT,
  PARTICIPANT_EVICTED,
  PARTICIPANT_PUBLISHED,
  PARTICIPANT_UNPUBLISHED,
  ICE_CANDIDATE,
  SEND_MESSAGE,
  ROOM_CLOSED,
  MEDIA_ERROR,
  UNKNOWN
};

constexpr std::string_view str(RoomEvent event) {
#define CASE(x)                                                                                    \
  case RoomEvent::x:                                                                               \
    return #x
  switch (event) {
    CASE(PARTICIPANT_JOINED);
    CASE(PARTICIPANT_LEFT);
    CASE(PARTICIPANT_EVICTED);
    CASE(PARTICIPANT_PUBLISHED);
    CASE(PARTICIPANT_UNPUBLISHED);
    CASE(ICE_CANDIDATE);
    CASE(SEND_MESSAGE);
    CASE(ROOM_CLOSED);
    CASE(MEDIA_ERROR);
    CASE(UNKNOWN);
  }
#undef CASE
  return "<unknown case>";
}

/**
 * @brief Map a notification method, e.g., "participantJoined", to its event.
 */
RoomEvent room_event_from_method(std::string_view method);

// ------------------------------------------------------------------------------------ RoomResponse

struct RoomResponse {
  int64_t id{0};
  nlohmann::json values{};

  /**
   * @brief The string member `key` of the result, if there is one.
   */
  std::optional<string> value(std::string_view key) const;
};

// --------------------------------------------------------------------------------------- RoomError

struct RoomError {
  int64_t id{0};
  std::error_code code{};  //!< `ecode::protocol_error` when the server reported the error
  int64_t server_code{0};
  string message{};
  nlohmann::json data{};

  static RoomError from_status(int64_t id, const rpc::Status& status);
};

// -------------------------------------------------------------------------------- RoomNotification

struct RoomNotification {
  string method{};
  nlohmann::json params{};

  RoomEvent event() const { return room_event_from_method(method); }

  /**
   * @brief The string parameter `key`, if there is one.
   */
  std::optional<string> param(std::string_view key) const;
};

} // namespace parley::room
