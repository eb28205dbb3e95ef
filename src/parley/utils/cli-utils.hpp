#pragma once

#include <limits>
#include <string>

/**
 * @defgroup cli Command Line Utils
 * @ingroup parley-utils
 *
 * Reading the value that follows a `--flag` on the `parley-room` command line.
 * Both functions advance `i` onto the value, and throw `std::runtime_error`
 * naming the flag when the value is missing or malformed.
 */

namespace parley::cli
{
std::string safe_arg_str(int argc, char** argv, int& i);

/// The value must be a decimal integer in `[min_value..max_value]`
int safe_arg_int(int argc, char** argv, int& i, int min_value = std::numeric_limits<int>::lowest(),
                 int max_value = std::numeric_limits<int>::max());

} // namespace parley::cli
