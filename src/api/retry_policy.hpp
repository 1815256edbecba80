#pragma once

#include "api/http_transport.hpp"
#include "core/cancellation.hpp"
#include "core/client_config.hpp"
#include "core/logger.hpp"
#include <chrono>
#include <thread>

namespace taskstream {

/**
 * Bounded retry schedule for one call (or one whole streaming session)
 *
 * max_attempts counts every attempt, the first one included: 1 means no retry.
 * The delay is fixed unless backoff_multiplier > 1.
 */
struct RetryPolicy {
    int max_attempts = 1;
    std::chrono::milliseconds delay{1000};
    double backoff_multiplier = 1.0;

    /**
     * Delay to wait after the given failed attempt (1-based)
     */
    std::chrono::milliseconds delay_after(int attempt) const;

    /**
     * Per-verb defaults: GET and DELETE are idempotent and get
     * config.max_retries retries; POST and PUT are never repeated.
     */
    static RetryPolicy for_method(HttpMethod method, const ClientConfig& config);

    static RetryPolicy no_retry();
};

/**
 * Run `attempt_fn` until it succeeds, fails with a non-transient error,
 * or the policy's attempt budget is spent.
 *
 * Only transient TransportErrors (timeouts, connection resets) are retried;
 * HTTP and application-level failures propagate immediately. The wait between
 * attempts returns early when `cancel` fires.
 *
 * @throws CancelledError if `cancel` fires before an attempt or during a delay
 */
template <typename AttemptFn>
auto with_retry(AttemptFn&& attempt_fn,
                const RetryPolicy& policy,
                const CancellationTokenPtr& cancel = nullptr,
                RequestContext ctx = RequestContext()) -> decltype(attempt_fn())
{
    for (int attempt = 1;; ++attempt) {
        if (cancel && cancel->is_cancelled()) {
            throw CancelledError("Request cancelled");
        }

        try {
            return attempt_fn();
        } catch (const TransportError& e) {
            if (e.kind() == TransportErrorKind::CANCELLED) {
                throw CancelledError("Request cancelled");
            }
            if (!e.is_transient() || attempt >= policy.max_attempts) {
                throw;
            }

            auto delay = policy.delay_after(attempt);
            ctx.attempt = attempt;
            Logger::get_instance().log_retry(ctx, policy.max_attempts, delay, e.what());

            if (cancel) {
                if (cancel->wait_for(delay)) {
                    throw CancelledError("Request cancelled");
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
    }
}

} // namespace taskstream
