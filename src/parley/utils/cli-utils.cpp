#include "cli-utils.hpp"

#include "base-include.hpp"

#include <charconv>
#include <stdexcept>

namespace parley::cli
{
/// @private
static const char* next_value(int argc, char** argv, int& i, std::string_view expected)
{
   Expects(argc >= 0);
   Expects(i >= 0 && i < argc);
   const char* flag = argv[i];
   if(++i >= argc)
      throw std::runtime_error(fmt::format("expected {} after argument '{}'", expected, flag));
   return argv[i];
}

// ---------------------------------------------------------------- safe-arg-str

std::string safe_arg_str(int argc, char** argv, int& i)
{
   return std::string{next_value(argc, argv, i, "string")};
}

// ---------------------------------------------------------------- safe-arg-int

int safe_arg_int(int argc, char** argv, int& i, int min_value, int max_value)
{
   const std::string_view flag = argv[i];
   const std::string_view text = next_value(argc, argv, i, "integer");

   int value      = 0;
   const auto end = text.data() + text.size();
   const auto [ptr, ec] = std::from_chars(text.data(), end, value);
   if(text.empty() || ec != std::errc{} || ptr != end)
      throw std::runtime_error(fmt::format("expected integer after argument '{}'", flag));

   if(value < min_value || value > max_value)
      throw std::runtime_error(fmt::format(
          "argument '{}' must be in [{}..{}], got {}", flag, min_value, max_value, value));

   return value;
}

} // namespace parley::cli
