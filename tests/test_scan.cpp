#include <catch2/catch.hpp>
#include <vernum/scan.hpp>

using namespace vernum;

TEST_CASE("finds a bare version", "[scan]") {
    auto r = find_first_version("1.4.2");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "1.4.2");
}

TEST_CASE("finds a version embedded in prose", "[scan]") {
    auto r = find_first_version("Release notes for v2.0.0-rc.1+build.7, 2024");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "2.0.0-rc.1+build.7");
}

TEST_CASE("skips lines without a valid version", "[scan]") {
    const std::string text =
        "# Changelog\n"
        "released on 2024-01-15\n"
        "requires 1.2 or newer\n"
        "version = \"3.1.4\"\n"
        "next = \"3.2.0\"\n";
    auto r = find_first_version(text);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "3.1.4");
}

TEST_CASE("trailing punctuation is not part of the version", "[scan]") {
    auto r = find_first_version("see 0.9.12.");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "0.9.12");
}

TEST_CASE("handles CRLF line endings", "[scan]") {
    auto r = find_first_version("name: demo\r\nversion: 5.6.7\r\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "5.6.7");
}

TEST_CASE("skips malformed candidates on the same line", "[scan]") {
    auto r = find_first_version("bad 1.02.3 good 1.2.3");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "1.2.3");
}

TEST_CASE("no version found", "[scan]") {
    auto r = find_first_version("nothing here\n1.2\nv1\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == VernumError::NotFound);
}

TEST_CASE("empty text", "[scan]") {
    REQUIRE(find_first_version("").is_err());
}
