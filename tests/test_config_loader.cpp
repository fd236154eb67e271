/**
 * @file test_config_loader.cpp
 * @brief Unit tests for ConfigLoader
 */

#include <catch2/catch_test_macros.hpp>
#include "sealbox/core/engine_config.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

using namespace sealbox::core;
using nlohmann::json;

TEST_CASE("ConfigLoader - Defaults", "[config]") {
    auto config = ConfigLoader::FromJson(json::object());

    REQUIRE(config.limits.max_source_bytes == 100000);
    REQUIRE(config.limits.default_memory_bytes == 128u * 1024 * 1024);
    REQUIRE(config.limits.default_time_ms == 30000);
    REQUIRE(config.policy.values.max_depth == 32);
    REQUIRE(config.policy.network.enabled);
    REQUIRE(config.policy.network.allowed_hosts.empty());
    REQUIRE(config.audit.sink == AuditSinkType::LOG);
    REQUIRE_FALSE(config.verbose_logging);
}

TEST_CASE("ConfigLoader - Overrides", "[config]") {
    auto config = ConfigLoader::FromJson(json::parse(R"({
        "limits": { "max_time_ms": 60000, "default_time_ms": 5000 },
        "policy": {
            "max_steps": 1000,
            "network": { "allowed_hosts": ["api.example.com"], "rate_limit_requests": 5 },
            "values": { "max_depth": 8 }
        },
        "audit": { "sink": "jsonl", "path": "/tmp/audit.jsonl", "async": false },
        "verbose_logging": true,
        "some_future_key": { "ignored": true }
    })"));

    REQUIRE(config.limits.max_time_ms == 60000);
    REQUIRE(config.limits.default_time_ms == 5000);
    REQUIRE(config.policy.max_steps == 1000);
    REQUIRE(config.policy.network.allowed_hosts == std::vector<std::string>{"api.example.com"});
    REQUIRE(config.policy.network.rate_limit_requests == 5);
    REQUIRE(config.policy.values.max_depth == 8);
    REQUIRE(config.policy.values.max_entries == 1000);
    REQUIRE(config.audit.sink == AuditSinkType::JSONL);
    REQUIRE(config.audit.path == "/tmp/audit.jsonl");
    REQUIRE_FALSE(config.audit.async);
    REQUIRE(config.verbose_logging);
}

TEST_CASE("ConfigLoader - Type errors", "[config]") {
    REQUIRE_THROWS_AS(ConfigLoader::FromJson(json::array()), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::FromJson(json{{"limits", 5}}), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::FromJson(json{{"verbose_logging", "yes"}}), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::FromJson(json{{"policy", {{"max_steps", -1}}}}), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::FromJson(json::parse(R"({"policy": {"allowed_globals": ["Math", 1]}})")),
                      ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::FromJson(json{{"audit", {{"sink", "syslog"}}}}), ConfigError);
    REQUIRE_THROWS_AS(ConfigLoader::FromJson(json{{"limits", {{"default_time_ms", 999999999}}}}),
                      ConfigError);
}

TEST_CASE("ConfigLoader - Memory ceiling from megabytes", "[config]") {
    PlatformLimits limits;
    limits.max_memory_bytes = 512u * 1024 * 1024;

    REQUIRE(ConfigLoader::MemoryCeilingBytes(64, limits) == 64u * 1024 * 1024);
    REQUIRE(ConfigLoader::MemoryCeilingBytes(512, limits) == limits.max_memory_bytes);
    REQUIRE_THROWS_AS(ConfigLoader::MemoryCeilingBytes(513, limits), ConfigError);

    // Would wrap to a small value if multiplied first
    std::size_t wrapping = (SIZE_MAX / (1024 * 1024)) + 2;
    REQUIRE_THROWS_AS(ConfigLoader::MemoryCeilingBytes(wrapping, limits), ConfigError);
}

TEST_CASE("ConfigLoader - Files", "[config]") {
    auto dir = std::filesystem::temp_directory_path() / "sealbox_tests";
    std::filesystem::create_directories(dir);

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(ConfigLoader::LoadFromFile(dir / "does_not_exist.json"), ConfigError);
    }

    SECTION("Invalid JSON") {
        auto path = dir / "broken.json";
        std::ofstream(path) << "{ not json";
        REQUIRE_THROWS_AS(ConfigLoader::LoadFromFile(path), ConfigError);
    }

    SECTION("Round trip through ToJson") {
        EngineConfig original;
        original.policy.max_steps = 42;
        original.policy.network.allowed_hosts = {"a.example.com"};
        auto path = dir / "roundtrip.json";
        std::ofstream(path) << ConfigLoader::ToJson(original).dump(2);

        auto loaded = ConfigLoader::LoadFromFile(path);
        REQUIRE(loaded.policy.max_steps == 42);
        REQUIRE(loaded.policy.network.allowed_hosts == original.policy.network.allowed_hosts);
        REQUIRE(loaded.policy.allowed_globals == original.policy.allowed_globals);
    }
}
