#include "stdinc.hpp"

#include "parley/utils/error-codes.hpp"

#include <catch2/catch.hpp>

namespace parley::tests {

CATCH_TEST_CASE("ErrorCodes", "[error-codes]") {
  CATCH_SECTION("okay-is-not-an-error") {
    error_code ec = ecode::okay;
    CATCH_REQUIRE(!ec);
  }

  CATCH_SECTION("category") {
    error_code ec = ecode::duplicate_id;
    CATCH_REQUIRE(ec);
    CATCH_REQUIRE(ec.category() == parley_category());
    CATCH_REQUIRE(string{ec.category().name()} == "parley");
    CATCH_REQUIRE(ec == ecode::duplicate_id);
    CATCH_REQUIRE(ec != ecode::not_connected);
  }

  CATCH_SECTION("messages") {
    CATCH_REQUIRE(make_error_code(ecode::not_connected).message() == "not connected");
    CATCH_REQUIRE(make_error_code(ecode::connection_lost).message() == "connection lost");
    CATCH_REQUIRE(make_error_code(ecode::decode_error).message() == "malformed message");
  }
}

} // namespace parley::tests
