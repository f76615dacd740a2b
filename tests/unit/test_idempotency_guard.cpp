// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "idempotency_guard.h"

#include <catch2/catch_test_macros.hpp>

using namespace waypoint;

TEST_CASE("IdempotencyGuard: registered steps start uncommitted", "[idempotency_guard]") {
    IdempotencyGuard guard;
    guard.register_step("building");
    guard.register_step("unit");

    REQUIRE(guard.flags().size() == 2);
    REQUIRE_FALSE(guard.has_committed("building"));
    REQUIRE_FALSE(guard.any_committed());
    REQUIRE(guard.committed_steps().empty());
}

TEST_CASE("IdempotencyGuard: unknown step is not committed", "[idempotency_guard]") {
    IdempotencyGuard guard;
    REQUIRE_FALSE(guard.has_committed("nope"));
}

TEST_CASE("IdempotencyGuard: mark_committed only moves false to true", "[idempotency_guard]") {
    IdempotencyGuard guard;
    guard.register_step("unit");

    guard.mark_committed("unit");
    guard.mark_committed("unit");
    guard.register_step("unit"); // re-registering must not clear the flag

    REQUIRE(guard.has_committed("unit"));
    REQUIRE(guard.any_committed());
}

TEST_CASE("IdempotencyGuard: committed steps are listed sorted", "[idempotency_guard]") {
    IdempotencyGuard guard;
    guard.mark_committed("unit");
    guard.mark_committed(IdempotencyGuard::FINISH_KEY);
    guard.mark_committed("building");

    std::vector<std::string> expected{"__finish__", "building", "unit"};
    REQUIRE(guard.committed_steps() == expected);
}

TEST_CASE("IdempotencyGuard: reset clears one flag, reset_all clears every flag",
          "[idempotency_guard]") {
    IdempotencyGuard guard;
    guard.mark_committed("building");
    guard.mark_committed("unit");

    guard.reset("unit");
    REQUIRE(guard.has_committed("building"));
    REQUIRE_FALSE(guard.has_committed("unit"));

    guard.reset_all();
    REQUIRE_FALSE(guard.any_committed());
    REQUIRE(guard.flags().size() == 2);
}

TEST_CASE("IdempotencyGuard: restore replaces flags but keeps registered steps",
          "[idempotency_guard]") {
    IdempotencyGuard guard;
    guard.register_step("building");
    guard.register_step("unit");
    guard.register_step("household");
    guard.mark_committed("household");

    guard.restore({{"building", true}, {"unit", true}});

    REQUIRE(guard.has_committed("building"));
    REQUIRE(guard.has_committed("unit"));
    REQUIRE_FALSE(guard.has_committed("household"));
    REQUIRE(guard.flags().count("household") == 1);
}
