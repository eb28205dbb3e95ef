#include "stdinc.hpp"

#include "parley/utils/cli-utils.hpp"

#include <catch2/catch.hpp>

namespace parley::cli::tests {

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  vector<string> args = {"parley-room", "--threads", "4", "--user", "alice", "--room"};
  vector<char*> argv_s;
  int argc = int(args.size());
  for (auto i = 0; i < argc; ++i)
    argv_s.push_back(args[i].data());
  char** argv = argv_s.data();

  CATCH_SECTION("cli-utils") {
    int i = 1;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 4);
    CATCH_REQUIRE(i == 2);
    i = 3;
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "alice");
    CATCH_REQUIRE(i == 4);
  }

  CATCH_SECTION("cli-utils-missing-argument") {
    int i = 5;
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(argc, argv, i), std::runtime_error);
  }

  CATCH_SECTION("cli-utils-not-an-integer") {
    int i = 3;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i), std::runtime_error);
  }

  CATCH_SECTION("cli-utils-integer-range") {
    int i = 1;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i, 1, 4) == 4);
    i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i, 1, 3), std::runtime_error);
    i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i, 5, 64), std::runtime_error);
  }

  CATCH_SECTION("cli-utils-rejects-trailing-characters") {
    vector<string> more = {"parley-room", "--threads", "4x", "--threads", "-2"};
    vector<char*> more_s;
    for (auto& arg : more)
      more_s.push_back(arg.data());
    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(int(more.size()), more_s.data(), i), std::runtime_error);
    i = 3;
    CATCH_REQUIRE(safe_arg_int(int(more.size()), more_s.data(), i) == -2);
  }
}

} // namespace parley::cli::tests
