#pragma once

#include "api/http_transport.hpp"
#include "api/retry_policy.hpp"
#include "auth/credential_store.hpp"
#include "auth/token_refresher.hpp"
#include "core/client_config.hpp"
#include "stream/stream_session.hpp"
#include <nlohmann/json.hpp>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace taskstream {

/**
 * Backend response envelope: {"status": bool, "message": string, "payload": T}
 */
template <typename T>
struct ApiResponse {
    bool status = false;
    std::string message;
    T payload{};
};

/**
 * Per-call options for plain requests
 */
struct RequestOptions {
    std::map<std::string, std::string> headers;  ///< Extra headers
    std::optional<RetryPolicy> retry;            ///< Overrides the per-verb policy
    CancellationTokenPtr signal;                 ///< Cancels the call and any retry delay
};

/**
 * Per-call options for streaming requests
 */
struct StreamOptions {
    HttpMethod method = HttpMethod::POST;
    std::map<std::string, std::string> headers;
    std::optional<RetryPolicy> retry;            ///< Overrides the per-verb reconnect policy
    CancellationTokenPtr signal;                 ///< Created by the client when not supplied
};

/**
 * Handle to a streaming session running on its own thread.
 * Destroying the handle waits for the session to finish. The RequestClient
 * that started the session must outlive the handle.
 */
class StreamHandle {
public:
    StreamHandle(CancellationTokenPtr signal, std::future<SessionState> result);

    StreamHandle(StreamHandle&&) = default;
    StreamHandle& operator=(StreamHandle&&) = default;

    /**
     * Cancel the session; it reaches ABORTED within one read cycle
     */
    void cancel();

    /**
     * Block until the session ends
     * @return the terminal state
     * @throws whatever a callback threw inside the session
     */
    SessionState wait();

    bool valid() const { return result_.valid(); }

private:
    CancellationTokenPtr signal_;
    std::future<SessionState> result_;
};

/**
 * Client for the task-execution backend
 *
 * Features:
 * - GET/POST/PUT/DELETE returning the typed response envelope
 * - Bearer credential on every request, one refresh-and-replay on 401
 * - Per-verb retry: GET and DELETE retried on transient transport failures,
 *   POST and PUT never repeated
 * - Streaming calls decoded frame by frame with per-call callbacks
 * - Thread-safe: plain calls and streaming sessions may run concurrently
 *
 * Example usage:
 *   RequestClient client(ClientConfig::load());
 *   auto conversation = client.get<Conversation>("/api/v1/conversations/42");
 *   client.stream("/api/v1/conversations/42/chat", {{"query", "hi"}}, callbacks);
 */
class RequestClient {
public:
    /**
     * Constructor using libcurl and the configured credential store
     * (FileCredentialStore when credentials_path is set, memory otherwise)
     */
    explicit RequestClient(const ClientConfig& config);

    /**
     * Constructor with explicit transport and credential store
     */
    RequestClient(const ClientConfig& config,
                  std::shared_ptr<HttpTransport> transport,
                  std::shared_ptr<CredentialStore> store);

    ~RequestClient();

    template <typename T = nlohmann::json>
    ApiResponse<T> get(const std::string& path, const RequestOptions& options = {}) {
        return parse_response<T>(execute(HttpMethod::GET, path, std::nullopt, options));
    }

    template <typename T = nlohmann::json>
    ApiResponse<T> post(const std::string& path,
                        const nlohmann::json& body = nullptr,
                        const RequestOptions& options = {}) {
        return parse_response<T>(execute(HttpMethod::POST, path, to_body(body), options));
    }

    template <typename T = nlohmann::json>
    ApiResponse<T> put(const std::string& path,
                       const nlohmann::json& body = nullptr,
                       const RequestOptions& options = {}) {
        return parse_response<T>(execute(HttpMethod::PUT, path, to_body(body), options));
    }

    template <typename T = nlohmann::json>
    ApiResponse<T> del(const std::string& path, const RequestOptions& options = {}) {
        return parse_response<T>(execute(HttpMethod::DELETE, path, std::nullopt, options));
    }

    /**
     * Plain call with auth and retry, returning the raw 2xx response
     * @throws HttpClientError on non-2xx status, TransportError when the retry
     *         budget is spent, AuthError on authentication failure,
     *         CancelledError when the signal fires
     */
    HttpResponse execute(HttpMethod method,
                         const std::string& path,
                         const std::optional<std::string>& body,
                         const RequestOptions& options = {});

    /**
     * Run a streaming call on the calling thread
     * @param body JSON request body (null sends none)
     * @return COMPLETED, FAILED or ABORTED
     */
    SessionState stream(const std::string& path,
                        const nlohmann::json& body,
                        StreamCallbacks callbacks,
                        StreamOptions options = {});

    /**
     * Run a streaming call on a dedicated thread
     */
    StreamHandle start_stream(const std::string& path,
                              const nlohmann::json& body,
                              StreamCallbacks callbacks,
                              StreamOptions options = {});

    const ClientConfig& config() const { return config_; }
    TokenRefresher& auth() { return *auth_; }
    CredentialStore& credentials() { return *store_; }

private:
    ClientConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<CredentialStore> store_;
    std::unique_ptr<TokenRefresher> auth_;

    HttpResponse send_authorized(const RequestDescriptor& request, bool& auth_replayed);

    static std::optional<std::string> to_body(const nlohmann::json& body);

    template <typename T>
    static ApiResponse<T> parse_response(const HttpResponse& response) {
        try {
            auto doc = nlohmann::json::parse(response.body);
            ApiResponse<T> result;
            result.status = doc.value("status", false);
            result.message = doc.value("message", "");
            auto payload = doc.find("payload");
            if (payload != doc.end() && !payload->is_null()) {
                result.payload = payload->template get<T>();
            }
            return result;
        } catch (const nlohmann::json::exception& e) {
            throw HttpClientError(std::string("Invalid API response: ") + e.what(),
                                  response.status_code);
        }
    }
};

} // namespace taskstream
