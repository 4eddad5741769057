// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "reconnect_backoff.h"

#include <algorithm>

namespace aerolink {

namespace {
// 2^20 * base overflows any sensible cap; stop doubling there
constexpr uint32_t MAX_SHIFT = 20;
} // namespace

ReconnectBackoff::ReconnectBackoff(BackoffPolicy policy, uint32_t seed)
    : policy_(policy), rng_(seed) {
    if (policy_.base.count() <= 0) {
        policy_.base = std::chrono::milliseconds(1);
    }
    if (policy_.cap < policy_.base) {
        policy_.cap = policy_.base;
    }
    policy_.jitter = std::clamp(policy_.jitter, 0.0, 1.0);
}

std::chrono::milliseconds ReconnectBackoff::next_delay() {
    uint32_t shift = std::min(attempts_, MAX_SHIFT);
    int64_t nominal = policy_.base.count() << shift;
    nominal = std::min<int64_t>(nominal, policy_.cap.count());

    int64_t jitter_ms = 0;
    if (policy_.jitter > 0.0) {
        std::uniform_real_distribution<double> dist(0.0, policy_.jitter);
        jitter_ms = static_cast<int64_t>(static_cast<double>(nominal) * dist(rng_));
    }

    int64_t delay = std::min<int64_t>(nominal + jitter_ms, policy_.cap.count());
    delay = std::max<int64_t>(delay, last_delay_.count());

    ++attempts_;
    last_delay_ = std::chrono::milliseconds(delay);
    return last_delay_;
}

void ReconnectBackoff::reset() {
    attempts_ = 0;
    last_delay_ = std::chrono::milliseconds(0);
}

} // namespace aerolink
