// SPDX-License-Identifier: MIT

// include/sheetload/retry_policy.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

#include "sheetload/database.hpp"

namespace sheetload {

/// Configuration for retrying transient statement failures.
struct RetryConfig {
    uint32_t max_retries = 3;                          ///< Maximum retry attempts
    std::chrono::milliseconds initial_delay{100};      ///< Delay before first retry
    std::chrono::milliseconds max_delay{5000};         ///< Delay cap
    double backoff_multiplier = 2.0;                   ///< Multiplier per attempt
    double jitter_factor = 0.1;                        ///< Random jitter range (+/- fraction)

    /// No retries; failures are recorded on the first attempt.
    static RetryConfig none() {
        return RetryConfig{
            .max_retries = 0,
            .initial_delay = std::chrono::milliseconds{0},
            .max_delay = std::chrono::milliseconds{0},
            .backoff_multiplier = 1.0,
            .jitter_factor = 0.0,
        };
    }
};

/// Stateful retry policy with exponential backoff, jitter, and error classification.
///
/// Only transient database errors (serialization failure, deadlock, lock
/// timeout) are retried; constraint violations and lost connections are not.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {})
        : config_(config), attempts_(0) {}

    /// Return true if the retry budget has not been exhausted.
    bool should_retry() const {
        return attempts_ < config_.max_retries;
    }

    /// Classify the error and check the retry budget.
    bool should_retry(const DatabaseError& e) const {
        return is_retryable(e) && attempts_ < config_.max_retries;
    }

    void record_attempt() {
        ++attempts_;
    }

    void reset() {
        attempts_ = 0;
    }

    /// Calculate next delay with exponential backoff and jitter.
    std::chrono::milliseconds next_delay() const {
        // Exponential backoff: initial * multiplier^attempts
        double delay_ms = static_cast<double>(config_.initial_delay.count());
        for (uint32_t i = 0; i < attempts_; ++i) {
            delay_ms *= config_.backoff_multiplier;
        }

        // Cap at max delay
        delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

        // Add jitter
        if (config_.jitter_factor > 0.0) {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_real_distribution<> dis(
                1.0 - config_.jitter_factor,
                1.0 + config_.jitter_factor);
            delay_ms *= dis(gen);
        }

        return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
    }

    /// Return true if the error represents a transient failure.
    static bool is_retryable(const DatabaseError& e) {
        return !e.connection_lost() && e.is_transient();
    }

    uint32_t attempts() const { return attempts_; }

private:
    RetryConfig config_;
    uint32_t attempts_;
};

}  // namespace sheetload
