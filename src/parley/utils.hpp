#pragma once

/**
 * @defgroup parley Parley
 */

/**
 * @defgroup parley-utils Utilities
 * @ingroup parley
 */

#include "utils/base-include.hpp"

#include "utils/cli-utils.hpp"
#include "utils/error-codes.hpp"
