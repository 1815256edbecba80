#pragma once

#include "api/http_transport.hpp"
#include "api/retry_policy.hpp"
#include "auth/token_refresher.hpp"
#include "stream/frame_decoder.hpp"
#include <atomic>
#include <functional>
#include <string>

namespace taskstream {

/**
 * Streaming session lifecycle state
 */
enum class SessionState {
    INIT,              ///< Created, not yet run
    CONNECTING,        ///< Streaming request issued, waiting for response headers
    STREAMING,         ///< Decode loop running
    REAUTHENTICATING,  ///< Got 401, refreshing the credential before one replay
    COMPLETED,         ///< Sentinel received, completion callback invoked
    FAILED,            ///< Error callback invoked
    ABORTED            ///< Cancelled, no callback invoked
};

/**
 * Convert session state to string for logging
 */
inline std::string session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::INIT: return "INIT";
        case SessionState::CONNECTING: return "CONNECTING";
        case SessionState::STREAMING: return "STREAMING";
        case SessionState::REAUTHENTICATING: return "REAUTHENTICATING";
        case SessionState::COMPLETED: return "COMPLETED";
        case SessionState::FAILED: return "FAILED";
        case SessionState::ABORTED: return "ABORTED";
        default: return "UNKNOWN";
    }
}

inline bool is_terminal(SessionState state) {
    return state == SessionState::COMPLETED ||
           state == SessionState::FAILED ||
           state == SessionState::ABORTED;
}

/**
 * Why a session failed
 */
enum class StreamErrorKind {
    APPLICATION,        ///< Backend sent a {"code", "message"} frame
    AUTHENTICATION,     ///< 401 after replay, or refresh rejected
    HTTP,               ///< Non-2xx response status other than 401
    TRANSPORT,          ///< Network failure after the retry budget was spent
    CONNECTION_CLOSED   ///< Body ended without the completion sentinel
};

/**
 * Error delivered to on_error (exactly once for a failed session)
 */
struct StreamError {
    StreamErrorKind kind = StreamErrorKind::TRANSPORT;
    int code = 0;             ///< Application code or HTTP status; 0 for transport failures
    std::string message;
    nlohmann::json payload;   ///< Full frame for APPLICATION errors
};

/**
 * Per-call callbacks. on_error and on_complete are mutually exclusive and
 * each fires at most once; none fires after cancellation.
 */
struct StreamCallbacks {
    std::function<void(const DataEvent&)> on_message;
    std::function<void(const StreamError&)> on_error;
    std::function<void(const StreamIds&)> on_complete;
    std::function<void(const DecodeError&)> on_diagnostic;  ///< Malformed frames (always logged too)
};

/**
 * One streaming call: authentication, decode loop, reconnect on transient
 * transport failure, cancellation and completion.
 *
 * The session runs on the caller's thread inside run(); the only blocking
 * point is the wait for the next body chunk. It is single-use.
 *
 * Usage Example:
 *   @code
 *   StreamCallbacks callbacks;
 *   callbacks.on_message = [](const DataEvent& e) { render(e.payload); };
 *   callbacks.on_complete = [](const StreamIds& ids) { save(ids.conversation_id); };
 *
 *   StreamSession session(transport, refresher, request, policy, callbacks);
 *   SessionState final_state = session.run();
 *   @endcode
 */
class StreamSession {
public:
    /**
     * @param transport Transport for the streaming request
     * @param auth Attaches and refreshes the bearer credential
     * @param request Descriptor replayed unchanged on reconnect and auth replay;
     *        a cancellation token is created if it carries none
     * @param policy Bounds whole-session reconnects after transient failures
     * @param callbacks Caller callbacks for this session only
     */
    StreamSession(HttpTransport& transport,
                  TokenRefresher& auth,
                  RequestDescriptor request,
                  RetryPolicy policy,
                  StreamCallbacks callbacks);

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    /**
     * Run the session to a terminal state
     * @return COMPLETED, FAILED or ABORTED
     * @throws std::logic_error if the session was already run; exceptions
     *         thrown by callbacks propagate after the connection is released
     */
    SessionState run();

    /**
     * Request cancellation (same as cancelling the request's token)
     */
    void cancel();

    SessionState state() const { return state_.load(); }

    const std::string& id() const { return id_; }

    /**
     * Streaming requests issued, auth replays included
     */
    int connect_count() const { return connect_count_; }

    /**
     * Replays performed after a successful token refresh (0 or 1)
     */
    int auth_replay_count() const { return auth_replay_count_; }

    const CancellationTokenPtr& signal() const { return request_.signal; }

private:
    HttpTransport& transport_;
    TokenRefresher& auth_;
    RequestDescriptor request_;
    RetryPolicy policy_;
    StreamCallbacks callbacks_;
    FrameDecoder decoder_;

    std::string id_;
    std::atomic<SessionState> state_;
    int connect_count_;
    int auth_replay_count_;

    void consume(StreamReader& reader);
    void dispatch(const Event& event);
    bool retry_after(const TransportError& error, int attempt);

    void transition(SessionState new_state);
    void abort();
    void fail(StreamErrorKind kind, int code, const std::string& message,
              const nlohmann::json& payload = nullptr);
    // Connect-path failures observed after a cancel end the session as ABORTED
    void fail_unless_cancelled(StreamErrorKind kind, int code, const std::string& message);
    bool cancelled() const { return request_.signal->is_cancelled(); }
    RequestContext context(int attempt) const;
};

} // namespace taskstream
