#include <catch2/catch.hpp>
#include <shortuuid/result.hpp>
#include <memory>
#include <string>

using namespace shortuuid;

static Result<int> try_double(Result<int> input) {
    SHORTUUID_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<int> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<int>::err(ShortUuidError{ShortUuidError::Parse, "first failed"})
        : Result<int>::ok(10);
    SHORTUUID_TRY(first);
    auto second = Result<int>::ok(first.value() + 5);
    SHORTUUID_TRY(second);
    return Result<int>::ok(second.value());
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(ShortUuidError{ShortUuidError::OutOfRange, "too wide"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ShortUuidError::OutOfRange);
    REQUIRE(r.error().message == "too wide");
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(ShortUuidError{ShortUuidError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok));
    REQUIRE_FALSE(static_cast<bool>(err));
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(ShortUuidError{ShortUuidError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("map() transforms Ok and passes through Err", "[result]") {
    auto mapped = Result<int>::ok(5).map([](int x) { return std::to_string(x); });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == "5");

    bool called = false;
    auto r = Result<int>::err(ShortUuidError{ShortUuidError::Parse, "bad input"});
    auto skipped = r.map([&](int x) { called = true; return x * 2; });
    REQUIRE(skipped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(skipped.error().message == "bad input");
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto chained = Result<int>::ok(5).and_then([](int x) {
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.value() == 15);

    bool called = false;
    auto r = Result<int>::err(ShortUuidError{ShortUuidError::InvalidArg, "nope"});
    auto skipped = r.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x + 10);
    });
    REQUIRE(skipped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(skipped.error().code == ShortUuidError::InvalidArg);
}

TEST_CASE("or_else() recovers from Err only", "[result]") {
    auto ok = Result<int>::ok(5).or_else([](const ShortUuidError&) {
        return Result<int>::ok(99);
    });
    REQUIRE(ok.value() == 5);

    auto recovered = Result<int>::err(ShortUuidError{ShortUuidError::IO, "disk"})
        .or_else([](const ShortUuidError&) { return Result<int>::ok(0); });
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("value_or() falls back on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(7) == 3);
    REQUIRE(Result<int>::err(ShortUuidError{ShortUuidError::IO, "x"}).value_or(7) == 7);
}

TEST_CASE("SHORTUUID_TRY propagates errors", "[result]") {
    auto input = Result<int>::err(ShortUuidError{ShortUuidError::Parse, "syntax error"});
    auto output = try_double(input);
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == ShortUuidError::Parse);
    REQUIRE(output.error().message == "syntax error");

    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("SHORTUUID_TRY chained", "[result]") {
    REQUIRE(try_chain(false).value() == 15);
    REQUIRE(try_chain(true).error().message == "first failed");
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(ShortUuidError{ShortUuidError::Config, "bad config"});
    REQUIRE(s.error().code == ShortUuidError::Config);
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
}

TEST_CASE("ShortUuidError format() output", "[error]") {
    ShortUuidError e{ShortUuidError::IO, "file not found", "check the path", "codec.toml", 3};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[IO]") != std::string::npos);
    REQUIRE(formatted.find("file not found") != std::string::npos);
    REQUIRE(formatted.find("hint: check the path") != std::string::npos);
    REQUIRE(formatted.find("--> codec.toml:3") != std::string::npos);
}

TEST_CASE("ShortUuidError format() without hint or file", "[error]") {
    ShortUuidError e{ShortUuidError::InvalidCharacter, "invalid character '0' at position 3"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[InvalidCharacter]: invalid character '0' at position 3");
}

TEST_CASE("ShortUuidError code_name() for all codes", "[error]") {
    REQUIRE(std::string(ShortUuidError::code_name(ShortUuidError::IO)) == "IO");
    REQUIRE(std::string(ShortUuidError::code_name(ShortUuidError::Parse)) == "Parse");
    REQUIRE(std::string(ShortUuidError::code_name(ShortUuidError::Config)) == "Config");
    REQUIRE(std::string(ShortUuidError::code_name(ShortUuidError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(ShortUuidError::code_name(ShortUuidError::InvalidAlphabet)) == "InvalidAlphabet");
    REQUIRE(std::string(ShortUuidError::code_name(ShortUuidError::InvalidCharacter)) == "InvalidCharacter");
    REQUIRE(std::string(ShortUuidError::code_name(ShortUuidError::OutOfRange)) == "OutOfRange");
}
