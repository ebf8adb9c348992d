#include <catch2/catch.hpp>
#include <lox/result.hpp>
#include <memory>
#include <string>

using namespace lox;

// Helper function that uses LOX_TRY
static Result<int> try_double(Result<int> input) {
    LOX_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<int> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<int>::err(LoxError{LoxError::Parse, "first failed", 1})
        : Result<int>::ok(10);
    LOX_TRY(first);
    auto second = Result<int>::ok(first.value() + 5);
    LOX_TRY(second);
    return Result<int>::ok(second.value());
}

static Result<std::unique_ptr<int>> make_boxed(bool fail) {
    if (fail) return LoxError{LoxError::Runtime, "no box", 7};
    return Result<std::unique_ptr<int>>::ok(std::make_unique<int>(3));
}

static Result<int> unbox(bool fail) {
    auto boxed = make_boxed(fail);
    LOX_TRY(boxed);
    return Result<int>::ok(*boxed.value());
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(LoxError{LoxError::Runtime, "missing item", 4});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.is_ok());
    REQUIRE(r.error().phase() == ErrorState::Runtime);
    REQUIRE(r.error().first().message == "missing item");
}

TEST_CASE("Implicit construction from LoxError and ErrorState", "[result]") {
    Result<int> from_error = LoxError{LoxError::IO, "io"};
    REQUIRE(from_error.is_err());
    REQUIRE(from_error.error().phase() == ErrorState::Host);

    auto st = ErrorState::parser();
    st.add({LoxError::Parse, "a", 1});
    st.add({LoxError::Parse, "b", 2});
    Result<int> from_state = st;
    REQUIRE(from_state.is_err());
    REQUIRE(from_state.error().size() == 2);
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(LoxError{LoxError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok) == true);
    REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(LoxError{LoxError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("map() transforms Ok value", "[result]") {
    auto r = Result<int>::ok(5);
    auto mapped = r.map([](int x) { return x * 2; });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == 10);
}

TEST_CASE("map() passes through Err", "[result]") {
    auto r = Result<int>::err(LoxError{LoxError::Parse, "bad input", 1});
    bool called = false;
    auto mapped = r.map([&](int x) { called = true; return std::to_string(x); });
    REQUIRE(mapped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().first().message == "bad input");
}

TEST_CASE("and_then() chains Ok results", "[result]") {
    auto r = Result<int>::ok(5);
    auto chained = r.and_then([](int x) {
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.is_ok());
    REQUIRE(chained.value() == 15);
}

TEST_CASE("or_else() recovers from Err", "[result]") {
    auto r = Result<int>::err(LoxError{LoxError::Config, "missing"});
    auto recovered = r.or_else([](const ErrorState&) { return Result<int>::ok(0); });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("LOX_TRY propagates errors", "[result]") {
    REQUIRE(try_double(Result<int>::ok(4)).value() == 8);
    auto failed = try_double(Result<int>::err(LoxError{LoxError::Scan, "s", 1}));
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().phase() == ErrorState::Scan);

    REQUIRE(try_chain(false).value() == 15);
    REQUIRE(try_chain(true).error().first().message == "first failed");
}

TEST_CASE("LOX_TRY works with move-only values", "[result]") {
    REQUIRE(unbox(false).value() == 3);
    auto r = unbox(true);
    REQUIRE(r.is_err());
    REQUIRE(r.error().format() == "[7]: no box");
}

TEST_CASE("Status helpers", "[result]") {
    Status s = ok_status();
    REQUIRE(s.is_ok());
    Status bad = LoxError{LoxError::Runtime, "x", 1};
    REQUIRE(bad.is_err());
}
