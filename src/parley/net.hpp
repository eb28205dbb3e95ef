#pragma once

/**
 * @defgroup parley-net Networking
 * @ingroup parley
 *
 * A connection state machine over a pluggable message transport, and a
 * Beast websocket implementation of that transport.
 */

#include "net/buffer.hpp"
#include "net/connection-state.hpp"
#include "net/connection.hpp"
#include "net/endpoint.hpp"
#include "net/transport.hpp"
#include "net/websockets/websocket-transport.hpp"
