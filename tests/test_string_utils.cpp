/**
 * @file test_string_utils.cpp
 * @brief Unit tests for StringUtils
 */

#include <catch2/catch_test_macros.hpp>
#include "sealbox/utils/string_utils.hpp"

using sealbox::utils::StringUtils;

TEST_CASE("StringUtils - Basic manipulation", "[string_utils]") {
    REQUIRE(StringUtils::Trim("  Host \t\n") == "Host");
    REQUIRE(StringUtils::Trim("   ").empty());
    REQUIRE(StringUtils::ToLower("X-Api-Key") == "x-api-key");

    REQUIRE(StringUtils::StartsWith("exec_abc", "exec_"));
    REQUIRE_FALSE(StringUtils::StartsWith("ex", "exec_"));
    REQUIRE(StringUtils::EndsWith("api.localhost", ".localhost"));
    REQUIRE(StringUtils::Contains("stack overflow", "overflow"));
}

TEST_CASE("StringUtils - Truncate keeps UTF-8 sequences whole", "[string_utils]") {
    REQUIRE(StringUtils::Truncate("short", 10) == "short");
    REQUIRE(StringUtils::Truncate("abcdef", 3) == "abc...");

    // "é" is two bytes; cutting after the first byte must back off
    std::string text = "a\xC3\xA9z";
    REQUIRE(StringUtils::Truncate(text, 2) == "a...");
}

TEST_CASE("StringUtils - IP literal detection", "[string_utils]") {
    REQUIRE(StringUtils::IsIPAddress("127.0.0.1"));
    REQUIRE(StringUtils::IsIPAddress("10.1.2.3"));
    REQUIRE(StringUtils::IsIPAddress("[::1]"));
    REQUIRE(StringUtils::IsIPAddress("fe80::1"));
    REQUIRE(StringUtils::IsIPAddress("2130706433"));
    REQUIRE(StringUtils::IsIPAddress("0x7f.1"));

    REQUIRE_FALSE(StringUtils::IsIPAddress("api.example.com"));
    REQUIRE_FALSE(StringUtils::IsIPAddress("1password.com"));
}

TEST_CASE("StringUtils - Identifiers", "[string_utils]") {
    REQUIRE(StringUtils::IsIdentifier("main"));
    REQUIRE(StringUtils::IsIdentifier("_handler$2"));
    REQUIRE_FALSE(StringUtils::IsIdentifier("2fast"));
    REQUIRE_FALSE(StringUtils::IsIdentifier("main()"));
    REQUIRE_FALSE(StringUtils::IsIdentifier(""));
}

TEST_CASE("StringUtils - Host matching", "[string_utils]") {
    REQUIRE(StringUtils::HostMatchesDomain("example.com", "example.com"));
    REQUIRE(StringUtils::HostMatchesDomain("API.Example.com", "example.com"));
    REQUIRE_FALSE(StringUtils::HostMatchesDomain("badexample.com", "example.com"));
    REQUIRE_FALSE(StringUtils::HostMatchesDomain("example.com.evil.io", "example.com"));
    REQUIRE_FALSE(StringUtils::HostMatchesDomain("", "example.com"));
}
