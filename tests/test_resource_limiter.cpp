/**
 * @file test_resource_limiter.cpp
 * @brief Unit tests for ResourceLimiter
 */

#include <catch2/catch_test_macros.hpp>
#include "sealbox/core/resource_limiter.hpp"

#include <thread>
#include <vector>

using namespace sealbox::core;

TEST_CASE("ResourceLimiter - Reservations within the ceiling", "[resource_limiter]") {
    ResourceLimiter limiter(1000);

    SECTION("Reservations accumulate") {
        REQUIRE_FALSE(limiter.Reserve(400).has_value());
        REQUIRE_FALSE(limiter.Reserve(600).has_value());
        REQUIRE(limiter.CurrentUsage() == 1000);
        REQUIRE(limiter.PeakUsage() == 1000);
        REQUIRE(limiter.Ceiling() == 1000);
    }

    SECTION("Zero bytes always succeeds") {
        REQUIRE_FALSE(limiter.Reserve(0).has_value());
        REQUIRE(limiter.CurrentUsage() == 0);
    }
}

TEST_CASE("ResourceLimiter - Refused reservations", "[resource_limiter]") {
    ResourceLimiter limiter(1000);
    REQUIRE_FALSE(limiter.Reserve(900).has_value());

    auto violation = limiter.Reserve(200);
    REQUIRE(violation.has_value());
    REQUIRE(violation->kind == "memory");
    REQUIRE(violation->requested == 1100);
    REQUIRE(violation->ceiling == 1000);
    REQUIRE(violation->Describe() ==
            "memory limit exceeded: requested 1100 bytes, ceiling 1000 bytes");

    // A refused reservation leaves usage untouched
    REQUIRE(limiter.CurrentUsage() == 900);
    REQUIRE(limiter.RejectedReservations() == 1);

    SECTION("Huge requests saturate instead of wrapping") {
        auto huge = limiter.Reserve(SIZE_MAX);
        REQUIRE(huge.has_value());
        REQUIRE(huge->requested == static_cast<std::uint64_t>(SIZE_MAX));
    }
}

TEST_CASE("ResourceLimiter - Release clamps at zero", "[resource_limiter]") {
    ResourceLimiter limiter(1000);
    REQUIRE_FALSE(limiter.Reserve(300).has_value());

    limiter.Release(100);
    REQUIRE(limiter.CurrentUsage() == 200);

    limiter.Release(5000);
    REQUIRE(limiter.CurrentUsage() == 0);
    REQUIRE(limiter.PeakUsage() == 300);

    REQUIRE_FALSE(limiter.Reserve(1000).has_value());
}

TEST_CASE("ResourceLimiter - Concurrent reservations never exceed the ceiling", "[resource_limiter]") {
    ResourceLimiter limiter(10000);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&limiter]() {
            for (int i = 0; i < 1000; ++i) {
                (void)limiter.Reserve(7);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(limiter.CurrentUsage() <= 10000);
    REQUIRE(limiter.PeakUsage() <= 10000);
    REQUIRE(limiter.RejectedReservations() > 0);
}

TEST_CASE("ResourceViolation - Step description", "[resource_limiter]") {
    ResourceViolation violation{"steps", 11, 10};
    REQUIRE(violation.Describe() == "step limit exceeded: 11 checkpoints, ceiling 10 checkpoints");
}
