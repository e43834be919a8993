// tonic_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <tonic/core/error.hpp>
#include <string>
#include <vector>

using namespace tonic_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE(err.is<std::string>());
    }

    SECTION("from code and message") {
        Error err(ErrorCode::ParseError, "Bad document");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.message() == "Bad document");
    }

    SECTION("default") {
        Error err;
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE_FALSE(err.message().empty());
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("alias", "click");
        auto* ctx = err.get_context("alias");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "click");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("ConfigError::missing_source") {
        Error err = ConfigError::missing_source();
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.is<ConfigError>());
    }

    SECTION("ConfigError::unknown_sprite") {
        Error err = ConfigError::unknown_sprite("intro");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.as<ConfigError>()->name == "intro");
        REQUIRE(err.message().find("intro") != std::string::npos);
    }

    SECTION("ConfigError::unknown_alias") {
        Error err = ConfigError::unknown_alias("click");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.as<ConfigError>()->kind == ConfigError::Kind::UnknownAlias);
    }

    SECTION("LoadError kinds") {
        Error io = LoadError::io_failed("a.wav", "no such file");
        REQUIRE(io.code() == ErrorCode::IOError);
        REQUIRE(io.as<LoadError>()->locator == "a.wav");

        Error decode = LoadError::decode_failed("bad header");
        REQUIRE(decode.code() == ErrorCode::DecodeError);
        REQUIRE(decode.message().rfind("Unable to decode file", 0) == 0);

        Error cancelled = LoadError::cancelled("stop()");
        REQUIRE(cancelled.code() == ErrorCode::Cancelled);
    }

    SECTION("UsageError kinds") {
        REQUIRE(Error(UsageError::duplicate_sprite("a")).code() == ErrorCode::AlreadyExists);
        REQUIRE(Error(UsageError::destroyed("Sound")).code() == ErrorCode::InvalidState);
        REQUIRE(Error(UsageError::not_playable("Sound")).code() == ErrorCode::InvalidState);
        REQUIRE(Error(UsageError::invalid_window(2.0, 1.0)).code() == ErrorCode::InvalidArgument);
        REQUIRE(Error(UsageError::node_in_use("Filter")).code() == ErrorCode::InvalidState);
    }

    SECTION("wrong kind yields null") {
        Error err = LoadError::cancelled("x");
        REQUIRE(err.as<ConfigError>() == nullptr);
        REQUIRE_FALSE(err.is<UsageError>());
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    SECTION("code and kind") {
        Error err = LoadError::io_failed("music.ogg", "denied");
        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("[IOError]") != std::string::npos);
        REQUIRE(chain.find("[LoadError]") != std::string::npos);
        REQUIRE(chain.find("music.ogg") != std::string::npos);
    }

    SECTION("context is appended") {
        Error err = Error(ErrorCode::NotSupported, "no device").with_context("device", "miniaudio");
        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("[NotSupported]") != std::string::npos);
        REQUIRE(chain.find("{device=miniaudio}") != std::string::npos);
    }

    SECTION("code names") {
        REQUIRE(std::string(error_code_name(ErrorCode::DecodeError)) == "DecodeError");
        REQUIRE(std::string(error_code_name(ErrorCode::Cancelled)) == "Cancelled");
    }
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_NOTHROW(r.unwrap());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(std::string("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err void from an error kind") {
        Result<void> r = Err(ConfigError::missing_source());
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
        REQUIRE_THROWS(r.unwrap());
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<float> r = Ok(0.5f);
        REQUIRE(r.value_or(1.0f) == 0.5f);
    }

    SECTION("value_or on Err") {
        Result<float> r = Err<float>(Error("error"));
        REQUIRE(r.value_or(1.0f) == 1.0f);
    }

    SECTION("unwrap on Err throws with the message") {
        Result<int> r = Err<int>(LoadError::decode_failed("truncated"));
        REQUIRE_THROWS_WITH(r.unwrap(), "Result contains error: Unable to decode file: truncated");
    }

    SECTION("move value out") {
        Result<std::vector<std::uint8_t>> r = Ok(std::vector<std::uint8_t>{1, 2, 3});
        std::vector<std::uint8_t> bytes = std::move(r).value();
        REQUIRE(bytes.size() == 3);
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<double> r = Ok(1.5);
        auto r2 = r.map([](double seconds) { return seconds * 1000.0; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 1500.0);
    }

    SECTION("map on Err keeps the error") {
        Result<double> r = Err<double>(Error(ErrorCode::NotFound, "missing"));
        auto r2 = r.map([](double seconds) { return seconds * 1000.0; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::NotFound);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.value() == "42");
    }

    SECTION("and_then on Err") {
        Result<int> r = Err<int>(Error("error"));
        bool called = false;
        auto r2 = r.and_then([&called](int x) -> Result<std::string> {
            called = true;
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_err());
        REQUIRE_FALSE(called);
    }
}
