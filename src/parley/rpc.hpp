#pragma once

/**
 * @defgroup parley-rpc JSON-RPC
 * @ingroup parley
 */

#include "rpc/codec.hpp"
#include "rpc/message.hpp"
#include "rpc/pending-call-registry.hpp"
#include "rpc/router.hpp"
#include "rpc/rpc-client.hpp"
#include "rpc/rpc-sink.hpp"
#include "rpc/status.hpp"
