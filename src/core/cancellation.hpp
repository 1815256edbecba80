#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace taskstream {

/**
 * Raised when a plain call observes its cancellation token
 */
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Cooperative cancellation signal shared between a caller and one call or session.
 *
 * Checked at every transport read boundary and before each retry or reconnect.
 * Cancellation is sticky: once set it is never cleared.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * Request cancellation and wake any thread blocked in wait_for()
     */
    void cancel();

    bool is_cancelled() const;

    /**
     * Sleep for up to `timeout`, returning early when cancelled
     * @return true if the token was cancelled before or during the wait
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline CancellationTokenPtr make_cancellation_token() {
    return std::make_shared<CancellationToken>();
}

} // namespace taskstream
