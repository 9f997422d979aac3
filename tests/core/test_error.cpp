// stratum_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <stratum/core/error.hpp>
#include <string>

using namespace stratum_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("RegistryError::unknown_type") {
        Error err = RegistryError::unknown_type("Sheaf");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.message().find("Sheaf") != std::string::npos);
        REQUIRE(err.as<RegistryError>()->kind == RegistryError::Kind::UnknownType);
    }

    SECTION("RegistryError::duplicate_type") {
        Error err = RegistryError::duplicate_type("Scheme");
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
    }

    SECTION("RegistryError::invalid_layer") {
        Error err = RegistryError::invalid_layer("Scheme", 11);
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<RegistryError>()->layer == 11);
    }

    SECTION("DeferredError::invalid_scope") {
        Error err = DeferredError::invalid_scope("Scheme", "Spec", "module");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message().find("module") != std::string::npos);
    }

    SECTION("DeferredError::owner_not_loaded") {
        Error err = DeferredError::owner_not_loaded("Scheme", "Spec");
        REQUIRE(err.code() == ErrorCode::InvalidState);
    }

    SECTION("UnitError::cyclic_load") {
        Error err = UnitError::cyclic_load("Scheme", "Scheme -> Spec -> Scheme");
        REQUIRE(err.code() == ErrorCode::DependencyMissing);
        REQUIRE(err.as<UnitError>()->path == "Scheme -> Spec -> Scheme");
    }

    SECTION("LayerViolationError::from_report") {
        Error err = LayerViolationError::from_report(2, "a\nb\n");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.as<LayerViolationError>()->violation_count == 2);
    }
}

TEST_CASE("Error type checking", "[core][error]") {
    Error err = UnitError::not_defined("Scheme");

    REQUIRE(err.is<UnitError>());
    REQUIRE_FALSE(err.is<RegistryError>());
    REQUIRE(err.as<UnitError>() != nullptr);
    REQUIRE(err.as<DeferredError>() == nullptr);
}

TEST_CASE("build_error_chain", "[core][error]") {
    Error err = Error(RegistryError::unknown_type("Sheaf"))
        .with_context("referenced_by", "Scheme");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[NotFound]") != std::string::npos);
    REQUIRE(chain.find("[RegistryError]") != std::string::npos);
    REQUIRE(chain.find("referenced_by: Scheme") != std::string::npos);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST_CASE("Result success", "[core][error]") {
    Result<int> result = Ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result);
    REQUIRE(result.value() == 42);
    REQUIRE(*result == 42);
}

TEST_CASE("Result error", "[core][error]") {
    Result<int> result = Err<int>(Error("Something went wrong"));

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.error().message() == "Something went wrong");
    REQUIRE(result.value_or(7) == 7);
}

TEST_CASE("Result map and and_then", "[core][error]") {
    SECTION("map on success") {
        Result<int> result = Ok(21);
        auto mapped = result.map([](int v) { return v * 2; });
        REQUIRE(mapped.value() == 42);
    }

    SECTION("map on error") {
        Result<int> result = Err<int>(Error("error"));
        auto mapped = result.map([](int v) { return v * 2; });
        REQUIRE(mapped.is_err());
    }

    SECTION("and_then chain") {
        Result<int> result = Ok(10);
        auto chained = result.and_then([](int v) -> Result<std::string> {
            return Ok(std::to_string(v));
        });
        REQUIRE(chained.value() == "10");
    }
}

TEST_CASE("Result<void>", "[core][error]") {
    SECTION("success") {
        Result<void> result = Ok();
        REQUIRE(result.is_ok());
        REQUIRE_NOTHROW(result.unwrap());
    }

    SECTION("error") {
        Result<void> result = Err(UnitError::not_defined("Scheme"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
        REQUIRE_THROWS(result.unwrap());
    }
}
