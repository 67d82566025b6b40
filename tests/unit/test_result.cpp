#include <catch2/catch_test_macros.hpp>
#include "codebox/core/result.hpp"

using namespace codebox::core;

TEST_CASE("Result with value", "[result]") {
    auto result = Result<int, std::string>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.value() == 42);
}

TEST_CASE("Result with error", "[result]") {
    auto result = Result<int, std::string>::err("something went wrong");

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.error() == "something went wrong");
}

TEST_CASE("Result void success", "[result]") {
    auto result = Result<void, Error>::ok();

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
}

TEST_CASE("Result void error", "[result]") {
    auto result = Result<void, Error>::err(ErrorCode::PipeFailed, "pipe2 for stdout: EMFILE");

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::PipeFailed);
    REQUIRE(result.error().message == "pipe2 for stdout: EMFILE");
}

TEST_CASE("Result value access on error throws", "[result]") {
    auto result = Result<int, Error>::err(ErrorCode::NotFound);

    REQUIRE_THROWS(result.value());
    REQUIRE(result.unwrap_or(7) == 7);
    REQUIRE(result.operator->() == nullptr);
}

TEST_CASE("Error full message includes context", "[result]") {
    Error error{ErrorCode::CommandNotAllowed, "command not allowed by policy", "curl"};

    REQUIRE(error.full_message() == "command not allowed by policy [curl]");
    REQUIRE(error.is_validation());
    REQUIRE_FALSE(error.is_retriable());
}

TEST_CASE("wrap_error prefixes the stage and keeps the code", "[result]") {
    Error inner{ErrorCode::DeadlineExceeded, "context deadline exceeded"};

    auto wrapped = wrap_error(inner, "failed to wait for container");

    REQUIRE(wrapped.code == ErrorCode::DeadlineExceeded);
    REQUIRE(wrapped.message == "failed to wait for container: context deadline exceeded");
    REQUIRE(wrapped.is_retriable());
}
