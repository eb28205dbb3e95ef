#pragma once

#include <cstdint>
#include <string_view>

namespace parley::net {

enum class ConnectionState : uint8_t {
  DISCONNECTED, // Initial state, and the state after the transport closed or failed
  CONNECTING,   // `connect` was called, the transport is opening
  CONNECTED,    // Sends are valid
  CLOSING       // `disconnect` was called, waiting for the transport to finish closing
};

constexpr std::string_view str(ConnectionState state) {
#define CASE(x)                                                                                    \
  case ConnectionState::x:                                                                         \
    return #x
  switch (state) {
    CASE(DISCONNECTED);
    CASE(CONNECTING);
    CASE(CONNECTED);
    CASE(CLOSING);
  }
#undef CASE
  return "<unknown case>";
}

} // namespace parley::net
