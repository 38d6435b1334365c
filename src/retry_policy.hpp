#pragma once

#include "config.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <random>

namespace supercast {

/// Decides whether a failed attempt is retried and how long to wait.
///
/// Only failures that never produced a response (timeouts and connection
/// failures) are retried.  A completed HTTP response is never retried here,
/// whatever its status.
class RetryPolicy {
public:
    RetryPolicy(int maxRetries,
                std::chrono::milliseconds initialDelay,
                std::chrono::milliseconds maxDelay);

    /// Deterministic jitter, for tests.
    RetryPolicy(int maxRetries,
                std::chrono::milliseconds initialDelay,
                std::chrono::milliseconds maxDelay,
                std::uint32_t seed);

    static RetryPolicy fromConfig(const Config& cfg);

    /// @param numRetries  retries already performed for this request.
    bool shouldRetry(FailureKind kind, int numRetries) const;

    /// Delay before retry number @p numRetries (1 for the first retry):
    /// min(initial * 2^(n-1), max), scaled by a jitter factor in [0.5, 1.0],
    /// and never below the initial delay.
    std::chrono::milliseconds backoffDelay(int numRetries);

    int maxRetries() const { return mMaxRetries; }
    std::chrono::milliseconds initialDelay() const { return mInitialDelay; }
    std::chrono::milliseconds maxDelay() const { return mMaxDelay; }

private:
    int                       mMaxRetries;
    std::chrono::milliseconds mInitialDelay;
    std::chrono::milliseconds mMaxDelay;
    std::mt19937              mRng;
};

} // namespace supercast
