#include <catch2/catch.hpp>
#include <vernum/result.hpp>
#include <vernum/version.hpp>
#include <memory>
#include <string>

using namespace vernum;

// Propagates the parse error, otherwise the major component
static Result<uint64_t> major_of(const std::string& s) {
    auto v = Version::parse(s);
    VERNUM_TRY(v);
    return Result<uint64_t>::ok(v.value().major());
}

// Both versions must parse; returns how many majors b is ahead of a
static Result<uint64_t> major_distance(const std::string& a, const std::string& b) {
    auto ma = major_of(a);
    VERNUM_TRY(ma);
    auto mb = major_of(b);
    VERNUM_TRY(mb);
    return Result<uint64_t>::ok(mb.value() - ma.value());
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.value() == 42);
    REQUIRE_THROWS_AS(r.error(), std::bad_variant_access);
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(VernumError{VernumError::NotFound, "no version", "notes.txt"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == VernumError::NotFound);
    REQUIRE(r.error().subject == "notes.txt");
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("map() transforms only Ok values", "[result]") {
    auto ok = Version::parse("1.4.0");
    auto text = ok.map([](Version& v) { return v.to_string(); });
    REQUIRE(text.value() == "1.4.0");

    bool called = false;
    auto bad = Version::parse("1.4");
    auto mapped = bad.map([&](Version& v) { called = true; return v.major(); });
    REQUIRE(mapped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().code == VernumError::MalformedVersion);
}

TEST_CASE("and_then() chains fallible steps", "[result]") {
    auto bumped = Version::parse("1.4.0").and_then(
        [](Version& v) { return v.next_minor(); });
    REQUIRE(bumped.value().to_string() == "1.5.0");

    auto failed = Version::parse("x").and_then(
        [](Version& v) { return v.next_minor(); });
    REQUIRE(failed.is_err());
}

TEST_CASE("or_else() on Ok passes through", "[result]") {
    auto r = major_of("3.0.0");
    bool called = false;
    auto recovered = r.or_else([&](VernumError&) {
        called = true;
        return Result<uint64_t>::ok(99);
    });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == 3);
    REQUIRE_FALSE(called);
}

TEST_CASE("or_else() on Err calls recovery", "[result]") {
    auto r = major_of("three");
    auto recovered = r.or_else([](VernumError& e) {
        REQUIRE(e.code == VernumError::MalformedVersion);
        return Result<uint64_t>::ok(0);
    });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("VERNUM_TRY passes Ok through", "[result]") {
    auto r = major_distance("1.0.0", "4.2.0");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 3);
}

TEST_CASE("VERNUM_TRY returns the first error", "[result]") {
    auto r = major_distance("1.0", "4.2");
    REQUIRE(r.is_err());
    REQUIRE(r.error().subject == "1.0");
}

TEST_CASE("Status carries only success or an error", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(VernumError{VernumError::Config, "bad config"});
    REQUIRE(s.error().code == VernumError::Config);
}

TEST_CASE("VernumError format() output", "[error]") {
    VernumError e{VernumError::IO, "cannot open config file", "vernum.toml",
                  "check the path"};
    e.at("vernum.toml", 3);
    auto formatted = e.format();
    REQUIRE(formatted.find("error[IO]: cannot open config file ('vernum.toml')") != std::string::npos);
    REQUIRE(formatted.find("hint: check the path") != std::string::npos);
    REQUIRE(formatted.find("--> vernum.toml:3") != std::string::npos);
}

TEST_CASE("VernumError format() without subject, hint or file", "[error]") {
    VernumError e{VernumError::Parse, "unexpected token"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Parse]: unexpected token");
}

TEST_CASE("VernumError code_name() for all codes", "[error]") {
    REQUIRE(std::string(VernumError::code_name(VernumError::MalformedVersion)) == "MalformedVersion");
    REQUIRE(std::string(VernumError::code_name(VernumError::Parse)) == "Parse");
    REQUIRE(std::string(VernumError::code_name(VernumError::Config)) == "Config");
    REQUIRE(std::string(VernumError::code_name(VernumError::Toolbox)) == "Toolbox");
    REQUIRE(std::string(VernumError::code_name(VernumError::NotFound)) == "NotFound");
    REQUIRE(std::string(VernumError::code_name(VernumError::IO)) == "IO");
    REQUIRE(std::string(VernumError::code_name(VernumError::InvalidArg)) == "InvalidArg");
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);

    auto r2 = Result<std::unique_ptr<int>>::err(VernumError{VernumError::IO, "fail"});
    REQUIRE(r2.is_err());
}
