#include "stdinc.hpp"

#include "parley/rpc/pending-call-registry.hpp"

#include <catch2/catch.hpp>

namespace parley::rpc::test {

CATCH_TEST_CASE("pending-call-registry", "[pending-call-registry]") {
  PendingCallRegistry registry;
  vector<string> log;

  auto recorder = [&log](string name) {
    return [&log, name](const Status& status, const nlohmann::json& result) {
      log.push_back(format("{}:{}:{}", name, status.ok() ? "ok" : status.code().message(),
                           result.dump()));
    };
  };

  CATCH_SECTION("resolve-exactly-once") {
    CATCH_REQUIRE(!registry.insert(1, recorder("a")));
    CATCH_REQUIRE(registry.contains(1));
    CATCH_REQUIRE(registry.resolve(1, Status{}, nlohmann::json{{"k", 1}}));
    CATCH_REQUIRE(!registry.contains(1));
    CATCH_REQUIRE(!registry.resolve(1, Status{}));
    CATCH_REQUIRE(log == vector<string>{R"(a:ok:{"k":1})"});
  }

  CATCH_SECTION("duplicate-id") {
    CATCH_REQUIRE(!registry.insert(5, recorder("first")));
    CATCH_REQUIRE(registry.insert(5, recorder("second")) == ecode::duplicate_id);
    CATCH_REQUIRE(registry.size() == 1);

    // The first registration is intact
    CATCH_REQUIRE(registry.resolve(5, Status{}, 1));
    CATCH_REQUIRE(log == vector<string>{"first:ok:1"});

    // And the id is free again
    CATCH_REQUIRE(!registry.insert(5, recorder("third")));
  }

  CATCH_SECTION("rejects-bad-arguments") {
    CATCH_REQUIRE(registry.insert(-1, recorder("a")) == ecode::argument_error);
    CATCH_REQUIRE(registry.insert(1, Continuation{}) == ecode::argument_error);
    CATCH_REQUIRE(registry.empty());
  }

  CATCH_SECTION("resolve-all-in-registration-order") {
    for (auto id : {30, 10, 20})
      CATCH_REQUIRE(!registry.insert(id, recorder(std::to_string(id))));
    CATCH_REQUIRE(registry.resolve_all(Status{ecode::connection_lost}) == 3);
    CATCH_REQUIRE(registry.empty());
    CATCH_REQUIRE(log
                  == vector<string>{"30:connection lost:null", "10:connection lost:null",
                                    "20:connection lost:null"});
    CATCH_REQUIRE(registry.resolve_all(Status{ecode::connection_lost}) == 0);
  }

  CATCH_SECTION("continuation-may-reregister") {
    CATCH_REQUIRE(!registry.insert(1, [&](const Status&, const nlohmann::json&) {
      log.push_back("outer");
      CATCH_REQUIRE(!registry.insert(1, recorder("inner")));
    }));
    CATCH_REQUIRE(registry.resolve(1, Status{}));
    CATCH_REQUIRE(registry.contains(1));
    CATCH_REQUIRE(registry.resolve(1, Status{ecode::protocol_error, "denied"}));
    CATCH_REQUIRE(log == vector<string>{"outer", "inner:server reported an error:null"});
  }

  CATCH_SECTION("throwing-continuation") {
    CATCH_REQUIRE(!registry.insert(1, [](const Status&, const nlohmann::json&) {
      throw std::runtime_error("boom");
    }));
    CATCH_REQUIRE(!registry.insert(2, recorder("b")));
    CATCH_REQUIRE(registry.resolve_all(Status{ecode::connection_lost}) == 2);
    CATCH_REQUIRE(log == vector<string>{"b:connection lost:null"});
  }
}

} // namespace parley::rpc::test
