// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace aerolink {

/**
 * @brief Reconnect delay policy settings
 */
struct BackoffPolicy {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{60000};
    double jitter = 0.25; ///< Upward jitter as a fraction of the nominal delay, [0, 1]
};

/**
 * @brief Exponential reconnect backoff with upward jitter
 *
 * Delay n is base * 2^n plus a random fraction of that, clamped to the cap and
 * to the previous delay. The sequence is therefore non-decreasing and settles
 * exactly on the cap. Jitter spreads reconnect bursts when many devices drop at
 * the same time.
 *
 * Not thread-safe; owned by one ConnectionSupervisor.
 */
class ReconnectBackoff {
  public:
    explicit ReconnectBackoff(BackoffPolicy policy = {}, uint32_t seed = std::random_device{}());

    /**
     * @brief Delay before the next attempt; advances the attempt counter
     */
    std::chrono::milliseconds next_delay();

    /**
     * @brief Forget previous failures (after a successful connect)
     */
    void reset();

    uint32_t attempts() const {
        return attempts_;
    }

    const BackoffPolicy& policy() const {
        return policy_;
    }

  private:
    BackoffPolicy policy_;
    std::mt19937 rng_;
    uint32_t attempts_ = 0;
    std::chrono::milliseconds last_delay_{0};
};

} // namespace aerolink
