#include <catch2/catch_test_macros.hpp>
#include "toolpipe/core/result.hpp"

using namespace toolpipe::core;

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
    auto result = Result<void, Error>::err(ErrorCode::InvalidTimeout, "timeout too small", "search");

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::InvalidTimeout);
    REQUIRE(result.error().full_message() == "timeout too small [search]");
}

TEST_CASE("Result from Error value", "[result]") {
    auto make = [](bool fail) -> Result<int, Error> {
        if (fail) {
            return Error{ErrorCode::ToolNotFound, "no such tool", "grep"};
        }
        return 7;
    };

    REQUIRE(make(false).value() == 7);
    REQUIRE(make(true).error().code == ErrorCode::ToolNotFound);
    REQUIRE(make(true).unwrap_or(-1) == -1);
}

TEST_CASE("Result map and and_then", "[result]") {
    auto doubled = Result<int, Error>::ok(21).map([](int v) { return v * 2; });
    REQUIRE(doubled.value() == 42);

    auto chained = Result<int, Error>::ok(1).and_then([](int) {
        return Result<std::string, Error>::err(ErrorCode::InvalidState);
    });
    REQUIRE(chained.is_err());
    REQUIRE(chained.error().message == "Invalid state");
}

TEST_CASE("Error classification", "[result]") {
    REQUIRE(Error{ErrorCode::ToolTimeout}.is_retriable());
    REQUIRE_FALSE(Error{ErrorCode::ToolExecutionFailed}.is_retriable());
    REQUIRE(Error{ErrorCode::InvalidParameters}.is_rejection());
    REQUIRE(Error{ErrorCode::SecurityViolation}.is_rejection());
    REQUIRE_FALSE(Error{ErrorCode::ToolNotFound}.is_rejection());
}

TEST_CASE("Error type mapping for tool results", "[result]") {
    REQUIRE(error_type_for(Error{ErrorCode::ToolTimeout}) == "timeout");
    REQUIRE(error_type_for(Error{ErrorCode::InvalidToolCallId}) == "validation");
    REQUIRE(error_type_for(Error{ErrorCode::InvalidArtifactId}) == "security");
    REQUIRE(error_type_for(Error{ErrorCode::ToolExecutionFailed, "boom", "runtime_error"}) == "runtime_error");
    REQUIRE(error_type_for(Error{ErrorCode::ToolExecutionFailed}) == "exception");
}

TEST_CASE("Exception kinds", "[result]") {
    REQUIRE(exception_kind(std::runtime_error("x")) == "runtime_error");
    REQUIRE(exception_kind(std::invalid_argument("x")) == "invalid_argument");
    REQUIRE(exception_kind(ToolException("rate_limited", "slow down")) == "rate_limited");

    auto error = Error::from_exception(std::out_of_range("index 4"));
    REQUIRE(error.code == ErrorCode::InternalError);
    REQUIRE(error.context == "out_of_range");
}
