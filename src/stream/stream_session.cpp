#include "stream/stream_session.hpp"
#include "core/logger.hpp"
#include <stdexcept>

namespace taskstream {

namespace {

std::string next_session_id() {
    static std::atomic<unsigned long> counter{0};
    return "stream-" + std::to_string(++counter);
}

} // namespace

StreamSession::StreamSession(HttpTransport& transport,
                             TokenRefresher& auth,
                             RequestDescriptor request,
                             RetryPolicy policy,
                             StreamCallbacks callbacks)
    : transport_(transport)
    , auth_(auth)
    , request_(std::move(request))
    , policy_(policy)
    , callbacks_(std::move(callbacks))
    , id_(next_session_id())
    , state_(SessionState::INIT)
    , connect_count_(0)
    , auth_replay_count_(0)
{
    if (!request_.signal) {
        request_.signal = make_cancellation_token();
    }
}

void StreamSession::cancel() {
    request_.signal->cancel();
}

SessionState StreamSession::run() {
    if (state() != SessionState::INIT) {
        throw std::logic_error("StreamSession " + id_ + " has already been run");
    }

    int attempt = 1;
    bool auth_replayed = false;

    while (true) {
        if (cancelled()) {
            abort();
            return state();
        }

        transition(SessionState::CONNECTING);
        ++connect_count_;

        AuthorizedRequest authorized = auth_.authorize(request_);
        StreamResponse response;
        try {
            response = transport_.open_stream(authorized.request);
        } catch (const TransportError& e) {
            if (retry_after(e, attempt)) {
                ++attempt;
                continue;
            }
            return state();
        }

        if (response.status_code == 401) {
            response.reader.reset();

            if (cancelled()) {
                abort();
                return state();
            }
            if (auth_replayed) {
                fail(StreamErrorKind::AUTHENTICATION, 401,
                     "Authentication failed after token refresh - please login again");
                return state();
            }

            transition(SessionState::REAUTHENTICATING);
            try {
                auth_.refresh(authorized.access_token, request_.signal);
            } catch (const CancelledError&) {
                abort();
                return state();
            } catch (const AuthError& e) {
                fail_unless_cancelled(StreamErrorKind::AUTHENTICATION, e.status_code(), e.what());
                return state();
            } catch (const CredentialStoreError& e) {
                fail_unless_cancelled(StreamErrorKind::AUTHENTICATION, 0, e.what());
                return state();
            }

            // The replay reuses the same descriptor and does not consume a retry attempt
            auth_replayed = true;
            ++auth_replay_count_;
            continue;
        }

        if (response.status_code < 200 || response.status_code >= 300) {
            response.reader.reset();
            fail_unless_cancelled(StreamErrorKind::HTTP, response.status_code,
                                  describe_http_status(response.status_code, ""));
            return state();
        }

        transition(SessionState::STREAMING);
        decoder_.reset();

        try {
            consume(*response.reader);
            return state();
        } catch (const TransportError& e) {
            response.reader->close();
            if (retry_after(e, attempt)) {
                // Partial progress is discarded: the replayed stream starts from byte zero
                ++attempt;
                continue;
            }
            return state();
        }
    }
}

void StreamSession::consume(StreamReader& reader) {
    while (true) {
        if (cancelled()) {
            reader.close();
            abort();
            return;
        }

        std::optional<std::string> chunk = reader.read();
        if (cancelled()) {
            reader.close();
            abort();
            return;
        }

        std::vector<Event> events = chunk ? decoder_.feed(*chunk) : decoder_.finish();
        for (const auto& event : events) {
            if (cancelled()) {
                reader.close();
                abort();
                return;
            }
            if (is_terminal(event)) {
                reader.close();
            }
            dispatch(event);
            if (is_terminal(state())) {
                return;
            }
        }

        if (!chunk) {
            reader.close();
            fail(StreamErrorKind::CONNECTION_CLOSED, 0,
                 "Stream ended before the completion sentinel");
            return;
        }
    }
}

void StreamSession::dispatch(const Event& event) {
    if (const auto* data = std::get_if<DataEvent>(&event)) {
        if (callbacks_.on_message) {
            callbacks_.on_message(*data);
        }
    } else if (const auto* decode_error = std::get_if<DecodeError>(&event)) {
        Logger::get_instance().log_decode_error(id_, decode_error->raw, decode_error->cause);
        if (callbacks_.on_diagnostic) {
            callbacks_.on_diagnostic(*decode_error);
        }
    } else if (const auto* app_error = std::get_if<ApplicationErrorEvent>(&event)) {
        fail(StreamErrorKind::APPLICATION, app_error->code, app_error->message, app_error->payload);
    } else if (std::holds_alternative<DoneEvent>(event)) {
        transition(SessionState::COMPLETED);
        if (callbacks_.on_complete) {
            callbacks_.on_complete(decoder_.last_seen_ids());
        }
    }
}

bool StreamSession::retry_after(const TransportError& error, int attempt) {
    if (cancelled() || error.kind() == TransportErrorKind::CANCELLED) {
        abort();
        return false;
    }

    if (!error.is_transient() || attempt >= policy_.max_attempts) {
        fail(StreamErrorKind::TRANSPORT, 0, error.what());
        return false;
    }

    auto delay = policy_.delay_after(attempt);
    Logger::get_instance().log_retry(context(attempt), policy_.max_attempts, delay, error.what());

    if (request_.signal->wait_for(delay)) {
        abort();
        return false;
    }
    return true;
}

void StreamSession::transition(SessionState new_state) {
    SessionState old_state = state_.exchange(new_state);
    Logger::get_instance().log_state_transition(
        id_, session_state_to_string(old_state), session_state_to_string(new_state));
}

void StreamSession::abort() {
    transition(SessionState::ABORTED);
}

void StreamSession::fail(StreamErrorKind kind, int code, const std::string& message,
                         const nlohmann::json& payload) {
    transition(SessionState::FAILED);
    Logger::get_instance().log_error(context(0), message);

    if (callbacks_.on_error) {
        StreamError error;
        error.kind = kind;
        error.code = code;
        error.message = message;
        error.payload = payload;
        callbacks_.on_error(error);
    }
}

void StreamSession::fail_unless_cancelled(StreamErrorKind kind, int code, const std::string& message) {
    if (cancelled()) {
        abort();
    } else {
        fail(kind, code, message);
    }
}

RequestContext StreamSession::context(int attempt) const {
    RequestContext ctx(method_to_string(request_.method), request_.url);
    ctx.attempt = attempt;
    ctx.session_id = id_;
    return ctx;
}

} // namespace taskstream
