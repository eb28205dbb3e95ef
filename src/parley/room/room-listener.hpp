#pragma once

#include "room-messages.hpp"

namespace parley::room {

/**
 * @brief Receives everything a `RoomApi` hears from the room server.
 *
 * Called from the client's dispatch context, one callback at a time.
 */
class RoomListener {
public:
  virtual ~RoomListener() = default;

  virtual void on_room_response(const RoomResponse& response) = 0;
  virtual void on_room_error(const RoomError& error) = 0;
  virtual void on_room_notification(const RoomNotification& notification) = 0;

  virtual void on_room_connected() {}
  virtual void on_room_disconnected(uint16_t code, std::string_view reason, bool remote) {}
};

} // namespace parley::room
