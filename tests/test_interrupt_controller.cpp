/**
 * @file test_interrupt_controller.cpp
 * @brief Unit tests for InterruptController
 */

#include <catch2/catch_test_macros.hpp>
#include "sealbox/core/execution_types.hpp"
#include "sealbox/core/interrupt_controller.hpp"

#include <thread>

using namespace sealbox::core;
using namespace std::chrono_literals;

TEST_CASE("InterruptController - Deadline fires the flag", "[interrupt_controller]") {
    InterruptController controller;
    REQUIRE_FALSE(controller.ShouldInterrupt());

    controller.Arm(50ms);
    REQUIRE(controller.IsArmed());

    auto start = std::chrono::steady_clock::now();
    while (!controller.ShouldInterrupt() &&
           std::chrono::steady_clock::now() - start < 2s) {
        std::this_thread::sleep_for(5ms);
    }

    REQUIRE(controller.ShouldInterrupt());
    REQUIRE(controller.Reason() == InterruptReason::DEADLINE);
    controller.Disarm();
    REQUIRE_FALSE(controller.IsArmed());
}

TEST_CASE("InterruptController - Disarm before the deadline", "[interrupt_controller]") {
    InterruptController controller;
    controller.Arm(10s);
    REQUIRE(controller.Remaining() > 5s);

    controller.Disarm();
    REQUIRE_FALSE(controller.ShouldInterrupt());
    REQUIRE(controller.Remaining() == 0ms);

    SECTION("Firing after disarm does nothing") {
        REQUIRE_FALSE(controller.Fire(InterruptReason::DEADLINE));
        REQUIRE_FALSE(controller.ShouldInterrupt());
    }

    SECTION("Disarm is idempotent") {
        controller.Disarm();
        REQUIRE_FALSE(controller.IsArmed());
    }
}

TEST_CASE("InterruptController - First reason wins", "[interrupt_controller]") {
    InterruptController controller;
    controller.Arm(10s);

    REQUIRE(controller.Cancel());
    REQUIRE_FALSE(controller.Fire(InterruptReason::DEADLINE));
    REQUIRE_FALSE(controller.Cancel());
    REQUIRE(controller.Reason() == InterruptReason::CANCELLED);
}

TEST_CASE("InterruptController - Unarmed controller ignores fire", "[interrupt_controller]") {
    InterruptController controller;
    REQUIRE_FALSE(controller.Cancel());
    REQUIRE_FALSE(controller.ShouldInterrupt());
    REQUIRE_FALSE(controller.Fire(InterruptReason::NONE));
}

TEST_CASE("InterruptController - Single use", "[interrupt_controller]") {
    InterruptController controller;
    controller.Arm(1s);
    controller.Disarm();
    REQUIRE_THROWS_AS(controller.Arm(1s), sealbox::SealboxError);
}
