#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace supercast {

RetryPolicy::RetryPolicy(int maxRetries,
                         std::chrono::milliseconds initialDelay,
                         std::chrono::milliseconds maxDelay)
    : RetryPolicy(maxRetries, initialDelay, maxDelay, std::random_device{}()) {}

RetryPolicy::RetryPolicy(int maxRetries,
                         std::chrono::milliseconds initialDelay,
                         std::chrono::milliseconds maxDelay,
                         std::uint32_t seed)
    : mMaxRetries(maxRetries)
    , mInitialDelay(initialDelay)
    , mMaxDelay(maxDelay)
    , mRng(seed) {}

RetryPolicy RetryPolicy::fromConfig(const Config& cfg) {
    return RetryPolicy(cfg.maxNetworkRetries,
                       cfg.initialNetworkRetryDelay,
                       cfg.maxNetworkRetryDelay);
}

bool RetryPolicy::shouldRetry(FailureKind kind, int numRetries) const {
    if (numRetries >= mMaxRetries) {
        return false;
    }

    switch (kind) {
        case FailureKind::Timeout:
        case FailureKind::ConnectionFailed:
            return true;
        case FailureKind::TlsFailure:
        case FailureKind::HttpStatus:
        case FailureKind::DecodeFailure:
        case FailureKind::Other:
            return false;
    }
    return false;
}

std::chrono::milliseconds RetryPolicy::backoffDelay(int numRetries) {
    const int exponent = std::max(numRetries, 1) - 1;
    const double initial = static_cast<double>(mInitialDelay.count());

    // Exponential, capped at the maximum delay.
    double delay = std::min(initial * std::pow(2.0, exponent),
                            static_cast<double>(mMaxDelay.count()));

    // Jitter: scale into [delay / 2, delay].
    std::uniform_real_distribution<double> jitter(0.5, 1.0);
    delay *= jitter(mRng);

    // Never wait less than the initial delay.
    delay = std::max(initial, delay);

    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(delay)));
}

} // namespace supercast
