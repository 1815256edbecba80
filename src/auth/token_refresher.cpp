#include "auth/token_refresher.hpp"
#include "core/logger.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace taskstream {

TokenRefresher::TokenRefresher(HttpTransport& transport,
                               CredentialStore& store,
                               const ClientConfig& config)
    : transport_(transport)
    , store_(store)
    , config_(config)
    , refresh_count_(0)
{
}

Credential TokenRefresher::current() const {
    Credential credential;
    if (auto stored = store_.get()) {
        credential = *stored;
    }
    if (credential.access_token.empty()) {
        credential.access_token = config_.fixed_access_token;
    }
    if (credential.refresh_token.empty()) {
        credential.refresh_token = config_.fixed_refresh_token;
    }
    return credential;
}

AuthorizedRequest TokenRefresher::authorize(const RequestDescriptor& request) const {
    AuthorizedRequest authorized;
    authorized.request = request;
    authorized.access_token = current().access_token;
    if (!authorized.access_token.empty()) {
        authorized.request.headers["Authorization"] = "Bearer " + authorized.access_token;
    }
    return authorized;
}

Credential TokenRefresher::refresh(const std::string& rejected_access_token,
                                   const CancellationTokenPtr& signal) {
    while (true) {
        std::promise<Credential> promise;
        std::shared_future<Credential> shared;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (inflight_.valid()) {
                shared = inflight_;
            } else {
                if (!rejected_access_token.empty()) {
                    auto stored = store_.get();
                    if (stored && !stored->access_token.empty() &&
                        stored->access_token != rejected_access_token) {
                        // Someone else refreshed after our request went out
                        Logger::get_instance().log_token_refresh(stored->refresh_token, true, "already refreshed");
                        return *stored;
                    }
                }
                inflight_ = promise.get_future().share();
            }
        }

        if (shared.valid()) {
            // Joined an in-flight refresh: rethrows its AuthError on failure
            try {
                Credential credential = shared.get();
                Logger::get_instance().log_token_refresh(credential.refresh_token, true, "shared");
                return credential;
            } catch (const CancelledError&) {
                // The owner of that refresh gave up; retry unless we did too
                if (signal && signal->is_cancelled()) {
                    throw;
                }
                continue;
            }
        }

        try {
            Credential credential = perform_refresh(signal);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inflight_ = std::shared_future<Credential>();
            }
            promise.set_value(credential);
            return credential;
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inflight_ = std::shared_future<Credential>();
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }
}

Credential TokenRefresher::perform_refresh(const CancellationTokenPtr& signal) {
    const std::string refresh_token = current().refresh_token;
    if (refresh_token.empty()) {
        throw refresh_failure(refresh_token, "No refresh token available - please login again", 401);
    }

    RequestDescriptor request;
    request.method = HttpMethod::POST;
    request.url = config_.url_for(config_.refresh_path);
    request.body = json{{"refresh_token", refresh_token}}.dump();
    request.signal = signal;

    ++refresh_count_;

    HttpResponse response;
    try {
        response = transport_.send(request);
    } catch (const TransportError& e) {
        if (e.kind() == TransportErrorKind::CANCELLED || (signal && signal->is_cancelled())) {
            Logger::get_instance().log_warning("Token refresh cancelled");
            throw CancelledError("Token refresh cancelled");
        }
        throw refresh_failure(refresh_token, std::string("Token refresh failed: ") + e.what(), 0);
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        std::ostringstream oss;
        oss << "Token refresh rejected (HTTP " << response.status_code << ") - please login again";
        throw refresh_failure(refresh_token, oss.str(), response.status_code);
    }

    Credential credential;
    try {
        auto doc = json::parse(response.body);
        const auto& payload = doc.at("payload");
        credential.access_token = payload.at("access_token").get<std::string>();
        credential.refresh_token = payload.at("refresh_token").get<std::string>();
    } catch (const json::exception& e) {
        throw refresh_failure(refresh_token,
                              std::string("Failed to parse refresh response: ") + e.what(),
                              response.status_code);
    }

    store_.set(credential);
    Logger::get_instance().log_token_refresh(refresh_token, true);
    return credential;
}

AuthError TokenRefresher::refresh_failure(const std::string& refresh_token,
                                          const std::string& message,
                                          int status_code) {
    store_.clear();
    Logger::get_instance().log_token_refresh(refresh_token, false, message);
    return AuthError(message, status_code);
}

} // namespace taskstream
