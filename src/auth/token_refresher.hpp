#pragma once

#include "api/http_transport.hpp"
#include "auth/credential_store.hpp"
#include "core/cancellation.hpp"
#include "core/client_config.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <string>

namespace taskstream {

/**
 * Authentication failure: the backend rejected the credential even after a
 * refresh, or the refresh endpoint rejected the refresh token.
 */
class AuthError : public HttpClientError {
public:
    explicit AuthError(const std::string& message, int status_code = 401)
        : HttpClientError(message, status_code) {}
};

/**
 * Request with the current bearer credential attached
 */
struct AuthorizedRequest {
    RequestDescriptor request;
    std::string access_token;  ///< Token that was attached (empty if none)
};

/**
 * Bearer credential lifecycle: attaches the current access token to outgoing
 * requests and exchanges the refresh token for a new pair on demand.
 *
 * Features:
 * - Single-flight refresh: concurrent callers collapse into one request to
 *   the refresh endpoint and all observe its outcome
 * - Stale-rejection detection: a caller whose rejected token has already been
 *   replaced by another refresh reuses the stored pair without a network call
 * - On refresh failure the credential store is cleared
 * - Tokens never logged in clear text
 */
class TokenRefresher {
public:
    /**
     * @param transport Transport used for the refresh call (no auth, no retry)
     * @param store Credential store; must outlive the refresher
     * @param config Provides refresh_path, base URL and fixed fallback tokens
     */
    TokenRefresher(HttpTransport& transport, CredentialStore& store, const ClientConfig& config);

    /**
     * Current credential: stored values, falling back field by field to the
     * configured fixed tokens
     */
    Credential current() const;

    /**
     * Copy `request` with "Authorization: Bearer <access token>" attached
     */
    AuthorizedRequest authorize(const RequestDescriptor& request) const;

    /**
     * Exchange the refresh token for a new credential pair
     *
     * @param rejected_access_token Token the backend just answered 401 to; when
     *        the store already holds a different access token, that pair is
     *        returned without contacting the refresh endpoint
     * @param signal Caller's cancellation token, attached to the refresh call
     * @return the new credential
     * @throws AuthError if the refresh endpoint rejects the refresh token or is
     *         unreachable (the store is cleared)
     * @throws CancelledError if `signal` fires while the refresh is in flight
     *         (the store is left untouched)
     */
    Credential refresh(const std::string& rejected_access_token = "",
                       const CancellationTokenPtr& signal = nullptr);

    /**
     * Number of calls made to the refresh endpoint
     */
    int refresh_count() const { return refresh_count_.load(); }

private:
    HttpTransport& transport_;
    CredentialStore& store_;
    ClientConfig config_;

    std::mutex mutex_;
    std::shared_future<Credential> inflight_;
    std::atomic<int> refresh_count_;

    Credential perform_refresh(const CancellationTokenPtr& signal);
    AuthError refresh_failure(const std::string& refresh_token,
                              const std::string& message, int status_code);
};

} // namespace taskstream
