/**
 * @file test_value_validator.cpp
 * @brief Unit tests for ValueValidator
 */

#include <catch2/catch_test_macros.hpp>
#include "sealbox/core/execution_types.hpp"
#include "sealbox/policy/value_validator.hpp"

using namespace sealbox::policy;
using nlohmann::json;

namespace {

json Nested(std::size_t depth) {
    json value = 1;
    for (std::size_t i = 0; i < depth; ++i) {
        value = json::array({value});
    }
    return value;
}

} // namespace

TEST_CASE("ValueValidator - Plain data passes", "[value_validator]") {
    ValueValidator validator{ValueLimits{}};

    json value = {
        {"name", "sensor-7"},
        {"readings", {1, 2.5, -3, nullptr, true}},
        {"meta", {{"unit", "kPa"}, {"tags", json::array()}}}
    };

    auto result = validator.Validate(value, "params");
    REQUIRE(result.valid);
    REQUIRE(result.error.empty());
}

TEST_CASE("ValueValidator - Depth limit", "[value_validator]") {
    ValueLimits limits;
    limits.max_depth = 5;
    ValueValidator validator{limits};

    REQUIRE(validator.Validate(Nested(4), "params").valid);

    auto result = validator.Validate(Nested(10), "params");
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.error.find("nesting depth") != std::string::npos);
}

TEST_CASE("ValueValidator - Entry limit", "[value_validator]") {
    ValueValidator validator{ValueLimits{}};

    json big = json::object();
    for (int i = 0; i < 10000; ++i) {
        big["k" + std::to_string(i)] = i;
    }

    auto result = validator.Validate(big, "params");
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.error.find("entries exceed limit of 1000") != std::string::npos);
}

TEST_CASE("ValueValidator - Forbidden keys", "[value_validator]") {
    ValueValidator validator{ValueLimits{}};

    for (const char* key : {"__proto__", "constructor", "prototype"}) {
        json value = {{"outer", {{key, 1}}}};
        auto result = validator.Validate(value, "params");
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.error == std::string("params.outer.") + key + ": forbidden key");
    }
}

TEST_CASE("ValueValidator - Forbidden string patterns", "[value_validator]") {
    ValueValidator validator{ValueLimits{}};

    SECTION("Function source") {
        auto result = validator.Validate(json{{"code", "function () { return 1; }"}}, "params");
        REQUIRE_FALSE(result.valid);
    }

    SECTION("Module loading") {
        REQUIRE_FALSE(validator.Validate(json{{"x", "require('fs')"}}, "params").valid);
        REQUIRE_FALSE(validator.Validate(json{{"x", "IMPORT ('net')"}}, "params").valid);
    }

    SECTION("Pattern past the first scan window") {
        std::string text(10000, 'a');
        text += "process.env";
        REQUIRE_FALSE(validator.Validate(json(text), "result").valid);
    }

    SECTION("Ordinary prose is fine") {
        REQUIRE(validator.Validate(json{{"x", "the process went well"}}, "params").valid);
    }
}

TEST_CASE("ValueValidator - Serialized size", "[value_validator]") {
    ValueLimits limits;
    limits.max_bytes = 64;
    ValueValidator validator{limits};

    json value = json::array();
    for (int i = 0; i < 20; ++i) {
        value.push_back("abcd");
    }

    auto result = validator.Validate(value, "result");
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.error.find("result: serialized size") == 0);
}

TEST_CASE("ValueValidator - Invalid configured pattern", "[value_validator]") {
    ValueLimits limits;
    limits.forbidden_patterns = {"("};
    REQUIRE_THROWS_AS(ValueValidator{limits}, sealbox::SealboxError);
}
