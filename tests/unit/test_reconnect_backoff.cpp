// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "reconnect_backoff.h"

#include <catch2/catch_test_macros.hpp>

using namespace aerolink;
using std::chrono::milliseconds;

TEST_CASE("ReconnectBackoff: doubles from base without jitter", "[backoff]") {
    ReconnectBackoff backoff({milliseconds(1000), milliseconds(60000), 0.0}, 42);

    REQUIRE(backoff.next_delay() == milliseconds(1000));
    REQUIRE(backoff.next_delay() == milliseconds(2000));
    REQUIRE(backoff.next_delay() == milliseconds(4000));
    REQUIRE(backoff.next_delay() == milliseconds(8000));
    REQUIRE(backoff.attempts() == 4);
}

TEST_CASE("ReconnectBackoff: settles exactly on the cap", "[backoff]") {
    ReconnectBackoff backoff({milliseconds(1000), milliseconds(60000), 0.25}, 7);

    milliseconds last{0};
    for (int i = 0; i < 40; ++i) {
        last = backoff.next_delay();
        REQUIRE(last <= milliseconds(60000));
    }
    REQUIRE(last == milliseconds(60000));
}

TEST_CASE("ReconnectBackoff: jittered sequence never decreases", "[backoff]") {
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        ReconnectBackoff backoff({milliseconds(500), milliseconds(30000), 1.0}, seed);
        milliseconds previous{0};
        for (int i = 0; i < 15; ++i) {
            milliseconds d = backoff.next_delay();
            REQUIRE(d >= previous);
            previous = d;
        }
    }
}

TEST_CASE("ReconnectBackoff: jitter stays within its fraction", "[backoff]") {
    ReconnectBackoff backoff({milliseconds(1000), milliseconds(600000), 0.25}, 99);

    milliseconds first = backoff.next_delay();
    REQUIRE(first >= milliseconds(1000));
    REQUIRE(first <= milliseconds(1250));

    milliseconds second = backoff.next_delay();
    REQUIRE(second >= milliseconds(2000));
    REQUIRE(second <= milliseconds(2500));
}

TEST_CASE("ReconnectBackoff: reset starts over from base", "[backoff]") {
    ReconnectBackoff backoff({milliseconds(1000), milliseconds(60000), 0.0}, 1);
    backoff.next_delay();
    backoff.next_delay();
    backoff.next_delay();

    backoff.reset();
    REQUIRE(backoff.attempts() == 0);
    REQUIRE(backoff.next_delay() == milliseconds(1000));
}

TEST_CASE("ReconnectBackoff: invalid policy is repaired", "[backoff]") {
    SECTION("cap below base is raised to base") {
        ReconnectBackoff backoff({milliseconds(5000), milliseconds(100), 0.0}, 1);
        REQUIRE(backoff.policy().cap == milliseconds(5000));
        REQUIRE(backoff.next_delay() == milliseconds(5000));
        REQUIRE(backoff.next_delay() == milliseconds(5000));
    }

    SECTION("jitter is clamped to [0, 1]") {
        ReconnectBackoff backoff({milliseconds(100), milliseconds(1000), 3.0}, 1);
        REQUIRE(backoff.policy().jitter == 1.0);
    }
}

TEST_CASE("ReconnectBackoff: many attempts do not overflow", "[backoff]") {
    ReconnectBackoff backoff({milliseconds(1000), milliseconds(60000), 0.0}, 1);
    for (int i = 0; i < 200; ++i) {
        milliseconds d = backoff.next_delay();
        REQUIRE(d > milliseconds(0));
        REQUIRE(d <= milliseconds(60000));
    }
    REQUIRE(backoff.next_delay() == milliseconds(60000));
}
