#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <string>

using namespace atrium;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err keeps kind, message and code", "[result]") {
    auto result = Result<int>::err(Error{ErrorKind::Storage, "disk I/O error", 10});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Storage);
    REQUIRE(result.unwrap_err().message == "disk I/O error");
    REQUIRE(result.unwrap_err().code == 10);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error::not_found("gone"));

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value and keeps errors", "[result]") {
    auto doubled = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(doubled.unwrap() == 42);

    auto failed = Result<int>::err(Error::conflict("busy")).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().kind == ErrorKind::Conflict);
}

TEST_CASE("Result::and_then chains and short-circuits", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error{"division by zero"});
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().message == "division by zero");
    REQUIRE(Result<int>::err(Error{"initial"}).and_then(divide).unwrap_err().message == "initial");
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("Result chaining works with different types", "[result]") {
    auto result = Result<int>::ok(5)
        .map([](int x) { return std::to_string(x); })
        .map([](const std::string& s) { return s + " items"; });

    REQUIRE(result.unwrap() == "5 items");
}

TEST_CASE("Error::describe names the kind and the failed rule", "[result][error]") {
    const auto collision = Error::validation(ValidationRule::SiblingCollision, "'talks' is taken");
    REQUIRE(collision.describe() == "ValidationError [path-collision]: 'talks' is taken");

    REQUIRE(Error::not_found("realm 7").describe() == "NotFound: realm 7");
    REQUIRE(Error::protocol("bad json").describe() == "ProtocolError: bad json");
}

TEST_CASE("Error retryability follows the propagation policy", "[result][error]") {
    REQUIRE(Error::transient("timeout").is_retryable());
    REQUIRE(Error::indexing("backend down").is_retryable());
    REQUIRE(Error::conflict("locked").is_retryable());

    REQUIRE_FALSE(Error::protocol("bad").is_retryable());
    REQUIRE_FALSE(Error::validation(ValidationRule::NameEmpty, "empty").is_retryable());
    REQUIRE_FALSE(Error::not_found("x").is_retryable());
    REQUIRE_FALSE(Error::not_authorized("x").is_retryable());
}
