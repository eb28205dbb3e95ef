#pragma once

#include "parley/utils.hpp"

namespace parley::net {

/**
 * @brief The components of a `ws://` or `wss://` url.
 */
struct Endpoint {
  bool secure{false};  //!< true for wss
  string host{};       //!< Host name or address, never empty
  uint16_t port{0};    //!< Defaults to 80 (ws) or 443 (wss)
  string path{"/"};    //!< Request target, always starts with '/'

  string to_string() const;

  bool operator==(const Endpoint&) const = default;
};

/**
 * @brief Parse a websocket url.
 *
 * Accepts `ws://host[:port][/path]` and `wss://host[:port][/path]`. Anything else,
 * including an empty host or a port outside [1..65535], is an `ecode::argument_error`.
 */
expected<Endpoint, error_code> parse_endpoint(string_view url);

} // namespace parley::net
