/**
 * @file test_sandbox_policy.cpp
 * @brief Unit tests for SandboxPolicy
 */

#include <catch2/catch_test_macros.hpp>
#include "sealbox/policy/sandbox_policy.hpp"

#include <memory>

using namespace sealbox::policy;

namespace {

std::shared_ptr<const PolicyConfig> MakeConfig(std::size_t max_log_bytes) {
    auto config = std::make_shared<PolicyConfig>();
    config->max_log_bytes = max_log_bytes;
    config->max_steps = 2;
    return config;
}

} // namespace

TEST_CASE("SandboxPolicy - Step guard", "[sandbox_policy]") {
    SandboxPolicy policy(MakeConfig(1024));

    REQUIRE_FALSE(policy.Step().has_value());
    REQUIRE_FALSE(policy.Step().has_value());

    auto violation = policy.Step();
    REQUIRE(violation.has_value());
    REQUIRE(violation->kind == "steps");
    REQUIRE(violation->ceiling == 2);
    REQUIRE(policy.Steps() == 3);
}

TEST_CASE("SandboxPolicy - Only the first violation is kept", "[sandbox_policy]") {
    SandboxPolicy policy(MakeConfig(1024));

    REQUIRE(policy.RecordViolation({"network.host", "domain not in allowlist: a.test"}));
    REQUIRE_FALSE(policy.RecordViolation({"dynamic-code", "Function"}));
    REQUIRE(policy.FirstViolation()->rule == "network.host");
}

TEST_CASE("SandboxPolicy - Console byte budget", "[sandbox_policy][logs]") {
    SECTION("Cut lines stay within the budget, marker included") {
        SandboxPolicy policy(MakeConfig(20));

        auto first = policy.AdmitLog("[log] 0123456789");
        REQUIRE(first.has_value());
        REQUIRE(*first == "[log] 0123456789");
        REQUIRE_FALSE(policy.LogsTruncated());

        auto second = policy.AdmitLog("[log] abcdef");
        REQUIRE(second.has_value());
        REQUIRE(*second == "[...");
        REQUIRE(first->size() + second->size() == 20);
        REQUIRE(policy.LogsTruncated());

        REQUIRE_FALSE(policy.AdmitLog("[log] x").has_value());
    }

    SECTION("No room left for the marker drops the line") {
        SandboxPolicy policy(MakeConfig(18));

        REQUIRE(policy.AdmitLog("[log] 0123456789").has_value());
        REQUIRE_FALSE(policy.AdmitLog("[log] abcdef").has_value());
        REQUIRE(policy.LogsTruncated());
        REQUIRE_FALSE(policy.AdmitLog("ok").has_value());
    }
}
