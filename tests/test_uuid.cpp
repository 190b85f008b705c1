#include <catch2/catch.hpp>
#include <vernum/uuid.hpp>
#include <set>

using namespace vernum;

TEST_CASE("UUID v4 version and variant bits", "[uuid]") {
    auto u = Uuid::v4();
    REQUIRE((u.bytes[6] & 0xF0) == 0x40);
    REQUIRE((u.bytes[8] & 0xC0) == 0x80);
}

TEST_CASE("UUID v4 generates unique values", "[uuid]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        REQUIRE(seen.insert(Uuid::v4().to_string()).second);
    }
}

TEST_CASE("UUID to_string layout", "[uuid]") {
    auto s = Uuid::v4().to_string();
    REQUIRE(s.size() == 36);
    REQUIRE(s[8] == '-');
    REQUIRE(s[13] == '-');
    REQUIRE(s[18] == '-');
    REQUIRE(s[23] == '-');
    REQUIRE(s[14] == '4');
}

TEST_CASE("UUID from_string reads a known value", "[uuid]") {
    auto r = Uuid::from_string("123E4567-e89b-42d3-a456-426614174000");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().bytes[0] == 0x12);
    REQUIRE(r.value().bytes[15] == 0x00);
    REQUIRE(r.value().to_string() == "123e4567-e89b-42d3-a456-426614174000");
}

TEST_CASE("UUID from_string accepts to_string output", "[uuid]") {
    auto u = Uuid::v4();
    auto parsed = Uuid::from_string(u.to_string());
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value() == u);
}

TEST_CASE("UUID from_string rejects bad input", "[uuid]") {
    REQUIRE(Uuid::from_string("too-short").error().code == VernumError::Parse);
    REQUIRE(Uuid::from_string("123e4567xe89b-42d3-a456-426614174000").is_err());
    REQUIRE(Uuid::from_string("123e4567-e89b-42d3-a456-42661417400g").is_err());
}
