#include "api/retry_policy.hpp"
#include <algorithm>
#include <cmath>

namespace taskstream {

std::chrono::milliseconds RetryPolicy::delay_after(int attempt) const {
    if (backoff_multiplier <= 1.0 || attempt <= 1) {
        return delay;
    }
    double scaled = static_cast<double>(delay.count()) * std::pow(backoff_multiplier, attempt - 1);
    return std::chrono::milliseconds(static_cast<long long>(scaled));
}

RetryPolicy RetryPolicy::for_method(HttpMethod method, const ClientConfig& config) {
    RetryPolicy policy;
    policy.delay = std::chrono::milliseconds(config.retry_delay_ms);
    policy.backoff_multiplier = config.backoff_multiplier;

    switch (method) {
        case HttpMethod::GET:
        case HttpMethod::DELETE:
            policy.max_attempts = 1 + std::max(0, config.max_retries);
            break;
        case HttpMethod::POST:
        case HttpMethod::PUT:
            // Repeating a non-idempotent call risks duplicate side effects
            policy.max_attempts = 1;
            break;
    }

    return policy;
}

RetryPolicy RetryPolicy::no_retry() {
    RetryPolicy policy;
    policy.max_attempts = 1;
    policy.delay = std::chrono::milliseconds(0);
    return policy;
}

} // namespace taskstream
