#include "api/request_client.hpp"
#include "api/http_client.hpp"
#include "core/logger.hpp"

namespace taskstream {

namespace {

std::shared_ptr<CredentialStore> make_store(const ClientConfig& config) {
    if (config.credentials_path.empty()) {
        return std::make_shared<MemoryCredentialStore>();
    }
    return std::make_shared<FileCredentialStore>(config.credentials_path);
}

} // namespace

StreamHandle::StreamHandle(CancellationTokenPtr signal, std::future<SessionState> result)
    : signal_(std::move(signal))
    , result_(std::move(result))
{
}

void StreamHandle::cancel() {
    if (signal_) {
        signal_->cancel();
    }
}

SessionState StreamHandle::wait() {
    return result_.get();
}

RequestClient::RequestClient(const ClientConfig& config)
    : RequestClient(config, std::make_shared<HttpClient>(config.timeout_ms), make_store(config))
{
}

RequestClient::RequestClient(const ClientConfig& config,
                             std::shared_ptr<HttpTransport> transport,
                             std::shared_ptr<CredentialStore> store)
    : config_(config)
    , transport_(std::move(transport))
    , store_(std::move(store))
    , auth_(std::make_unique<TokenRefresher>(*transport_, *store_, config_))
{
}

RequestClient::~RequestClient() = default;

HttpResponse RequestClient::execute(HttpMethod method,
                                    const std::string& path,
                                    const std::optional<std::string>& body,
                                    const RequestOptions& options) {
    RequestDescriptor request;
    request.method = method;
    request.url = config_.url_for(path);
    request.body = body;
    request.headers = options.headers;
    request.signal = options.signal;

    RetryPolicy policy = options.retry ? *options.retry : RetryPolicy::for_method(method, config_);
    RequestContext ctx(method_to_string(method), request.url);

    // Shared across retry attempts: at most one refresh per call
    bool auth_replayed = false;

    try {
        return with_retry([&] { return send_authorized(request, auth_replayed); },
                          policy, request.signal, ctx);
    } catch (const HttpClientError& e) {
        Logger::get_instance().log_error(ctx, e.what());
        throw;
    }
}

HttpResponse RequestClient::send_authorized(const RequestDescriptor& request, bool& auth_replayed) {
    AuthorizedRequest authorized = auth_->authorize(request);
    HttpResponse response = transport_->send(authorized.request);

    if (response.status_code == 401) {
        if (auth_replayed) {
            throw AuthError(describe_http_status(401, response.body), 401);
        }
        auth_replayed = true;

        auth_->refresh(authorized.access_token, request.signal);
        authorized = auth_->authorize(request);
        response = transport_->send(authorized.request);

        if (response.status_code == 401) {
            throw AuthError(describe_http_status(401, response.body), 401);
        }
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        throw HttpClientError(describe_http_status(response.status_code, response.body),
                              response.status_code);
    }

    return response;
}

SessionState RequestClient::stream(const std::string& path,
                                   const nlohmann::json& body,
                                   StreamCallbacks callbacks,
                                   StreamOptions options) {
    RequestDescriptor request;
    request.method = options.method;
    request.url = config_.url_for(path);
    request.body = to_body(body);
    request.headers = options.headers;
    request.headers["Accept"] = "text/event-stream";
    request.signal = options.signal ? options.signal : make_cancellation_token();

    RetryPolicy policy = options.retry ? *options.retry
                                       : RetryPolicy::for_method(options.method, config_);

    StreamSession session(*transport_, *auth_, std::move(request), policy, std::move(callbacks));
    return session.run();
}

StreamHandle RequestClient::start_stream(const std::string& path,
                                         const nlohmann::json& body,
                                         StreamCallbacks callbacks,
                                         StreamOptions options) {
    if (!options.signal) {
        options.signal = make_cancellation_token();
    }
    CancellationTokenPtr signal = options.signal;

    auto result = std::async(std::launch::async,
        [this, path, body, callbacks = std::move(callbacks), options = std::move(options)]() mutable {
            return stream(path, body, std::move(callbacks), std::move(options));
        });

    return StreamHandle(std::move(signal), std::move(result));
}

std::optional<std::string> RequestClient::to_body(const nlohmann::json& body) {
    if (body.is_null()) {
        return std::nullopt;
    }
    return body.dump();
}

} // namespace taskstream
