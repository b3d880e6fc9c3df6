/// @file test_error.cpp
/// @brief Tests for impulse_core error values and Result

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <impulse/core/error.hpp>

#include <memory>
#include <vector>

using namespace impulse_core;
using Catch::Matchers::ContainsSubstring;

namespace {

Result<int> parse_positive(int raw) {
    if (raw <= 0) {
        return Error(ConfigError::invalid_value("count", "must be positive"));
    }
    return raw;
}

Result<void> require_body(std::uint64_t id) {
    if (id == 0) {
        return Error(PhysicsError::body_not_found(id));
    }
    return Ok();
}

} // anonymous namespace

TEST_CASE("Error payload kinds map to codes", "[core][error]") {
    SECTION("physics lookups are NotFound") {
        Error err = PhysicsError::body_not_found(12);
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is<PhysicsError>());
        REQUIRE(err.as<PhysicsError>()->object_id == 12);
        REQUIRE(err.as<ConfigError>() == nullptr);
        REQUIRE(Error(PhysicsError::joint_not_found(3)).code() == ErrorCode::NotFound);
    }

    SECTION("rejected descriptors are InvalidArgument") {
        REQUIRE(Error(PhysicsError::invalid_body("x")).code() == ErrorCode::InvalidArgument);
        REQUIRE(Error(PhysicsError::invalid_shape("x")).code() == ErrorCode::InvalidArgument);
        REQUIRE(Error(PhysicsError::invalid_joint("x")).code() == ErrorCode::InvalidArgument);
    }

    SECTION("config kinds") {
        REQUIRE(Error(ConfigError::invalid_value("slop", "negative")).code() == ErrorCode::ValidationError);
        REQUIRE(Error(ConfigError::parse_failed("eof")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ConfigError::type_mismatch("gravity")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ConfigError::truncated(95, 10)).code() == ErrorCode::ParseError);
        REQUIRE(Error(ConfigError::unsupported_version(7)).code() == ErrorCode::IncompatibleVersion);
        REQUIRE(Error(ConfigError::io_failed("/nope")).code() == ErrorCode::IOError);
    }

    SECTION("plain messages") {
        Error err("something broke");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE(err.message() == "something broke");
        REQUIRE(Error(ErrorCode::NotFound, "gone").code() == ErrorCode::NotFound);
    }

    SECTION("code names") {
        REQUIRE(std::string(error_code_name(ErrorCode::IOError)) == "IOError");
        REQUIRE(std::string(error_code_name(ErrorCode::IncompatibleVersion)) == "IncompatibleVersion");
    }
}

TEST_CASE("Error context keeps insertion order", "[core][error]") {
    Error err = ConfigError::parse_failed("unexpected token");
    err.with_context("path", "world.json").with_context("line", "4");
    err.with_context("path", "other.json");

    REQUIRE(err.context().size() == 2);
    REQUIRE(err.context()[0].first == "path");
    REQUIRE(*err.get_context("path") == "other.json");
    REQUIRE(*err.get_context("line") == "4");
    REQUIRE(err.get_context("column") == nullptr);
}

TEST_CASE("format_error renders code, detail and context", "[core][error]") {
    Error body = PhysicsError::body_not_found(9);
    REQUIRE_THAT(format_error(body), ContainsSubstring("[NotFound]"));
    REQUIRE_THAT(format_error(body), ContainsSubstring("(id 9)"));

    Error field = ConfigError::invalid_value("fixed_dt", "must be positive");
    field.with_context("source", "json");
    const std::string text = format_error(field);
    REQUIRE_THAT(text, ContainsSubstring("[ValidationError]"));
    REQUIRE_THAT(text, ContainsSubstring("(field fixed_dt)"));
    REQUIRE_THAT(text, ContainsSubstring("{source=json}"));
}

TEST_CASE("Result holds a value or an error", "[core][result]") {
    SECTION("value") {
        auto ok = parse_positive(5);
        REQUIRE(ok.is_ok());
        REQUIRE(ok);
        REQUIRE(*ok == 5);
        REQUIRE(ok.value_or(-1) == 5);
    }

    SECTION("error") {
        auto bad = parse_positive(0);
        REQUIRE(bad.is_err());
        REQUIRE_FALSE(bad);
        REQUIRE(bad.value_or(-1) == -1);
        REQUIRE(bad.error().as<ConfigError>()->field == "count");
    }

    SECTION("unwrap throws on error") {
        REQUIRE(parse_positive(3).unwrap() == 3);
        REQUIRE_THROWS_AS(parse_positive(-2).unwrap(), BadResultAccess);
        REQUIRE_THROWS_WITH(parse_positive(-2).unwrap(), ContainsSubstring("count"));
    }

    SECTION("move-only values") {
        Result<std::unique_ptr<int>> owned(std::make_unique<int>(4));
        auto ptr = std::move(owned).unwrap();
        REQUIRE(*ptr == 4);
    }

    SECTION("arrow access") {
        Result<std::vector<int>> list(std::vector<int>{1, 2, 3});
        REQUIRE(list->size() == 3);
    }
}

TEST_CASE("Result<void>", "[core][result]") {
    REQUIRE(require_body(1).is_ok());
    REQUIRE_NOTHROW(require_body(1).unwrap());

    auto missing = require_body(0);
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code() == ErrorCode::NotFound);
    REQUIRE_THROWS_AS(missing.unwrap(), BadResultAccess);

    REQUIRE(Err(Error("nope")).is_err());
}

TEST_CASE("Result combinators", "[core][result]") {
    SECTION("map") {
        auto doubled = parse_positive(4).map([](int v) { return v * 2.5f; });
        REQUIRE(doubled.is_ok());
        REQUIRE(*doubled == 10.0f);

        auto passed = parse_positive(0).map([](int v) { return v + 1; });
        REQUIRE(passed.error().code() == ErrorCode::ValidationError);
    }

    SECTION("and_then stops at the first error") {
        int calls = 0;
        auto chained = parse_positive(0).and_then([&calls](int v) {
            ++calls;
            return parse_positive(v - 10);
        });
        REQUIRE(chained.is_err());
        REQUIRE(calls == 0);

        auto second = parse_positive(4).and_then([](int v) { return parse_positive(v - 10); });
        REQUIRE(second.is_err());
    }

    SECTION("or_else recovers") {
        auto recovered = parse_positive(-1).or_else([](const Error&) { return Result<int>(1); });
        REQUIRE(*recovered == 1);

        auto untouched = parse_positive(8).or_else([](const Error&) { return Result<int>(1); });
        REQUIRE(*untouched == 8);
    }

    SECTION("Err helper") {
        auto err = Err<float>(Error(ErrorCode::ParseError, "bad float"));
        REQUIRE(err.error().message() == "bad float");
    }
}
