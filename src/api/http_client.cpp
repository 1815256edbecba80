#include "api/http_client.hpp"
#include "core/logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <memory>
#include <mutex>
#include <sstream>

namespace taskstream {

namespace {

// Upper bound on how long a streaming read blocks before re-checking cancellation
constexpr int POLL_INTERVAL_MS = 100;

std::once_flag curl_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct EasyHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string trim(const std::string& value) {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Parse header line: "Name: Value\r\n"
void parse_header_line(const std::string& header, std::map<std::string, std::string>& headers) {
    size_t colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        headers[header.substr(0, colon_pos)] = trim(header.substr(colon_pos + 1));
    }
}

// CURL header callback
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    parse_header_line(std::string(buffer, total_size), *headers);
    return total_size;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* token = static_cast<CancellationToken*>(clientp);
    return token->is_cancelled() ? 1 : 0;
}

TransportErrorKind classify(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportErrorKind::TIMEOUT;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return TransportErrorKind::CONNECTION;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportErrorKind::CANCELLED;
        default:
            return TransportErrorKind::OTHER;
    }
}

TransportError to_transport_error(CURLcode code) {
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        return TransportError("Request cancelled", TransportErrorKind::CANCELLED);
    }
    std::string error_msg = "CURL error: ";
    error_msg += curl_easy_strerror(code);
    return TransportError(error_msg, classify(code));
}

/**
 * Apply method, body, headers and cancellation to an easy handle.
 * The returned list must outlive the transfer.
 */
HeaderList configure_request(CURL* curl, const RequestDescriptor& request) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            break;
        case HttpMethod::PUT:
        case HttpMethod::DELETE:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method_to_string(request.method).c_str());
            break;
    }

    if (request.body || request.method == HttpMethod::POST) {
        const std::string& body = request.body ? *request.body : std::string();
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, body.c_str());
    }

    curl_slist* curl_headers = curl_slist_append(nullptr, "Content-Type: application/json");
    for (const auto& [key, value] : request.headers) {
        std::string header_line = key + ": " + value;
        curl_headers = curl_slist_append(curl_headers, header_line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);

    if (request.signal) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, request.signal.get());
    }

    return HeaderList(curl_headers);
}

/**
 * StreamReader over a curl multi handle: perform() is driven from read(),
 * so body bytes are only pulled off the socket when the consumer asks.
 */
class CurlStreamReader : public StreamReader {
public:
    CurlStreamReader(const RequestDescriptor& request, int timeout_ms)
        : signal_(request.signal)
    {
        multi_ = curl_multi_init();
        easy_ = curl_easy_init();
        if (!multi_ || !easy_) {
            close();
            throw TransportError("Failed to initialize CURL", TransportErrorKind::OTHER);
        }

        header_list_ = configure_request(easy_, request);

        // A stream may legitimately stay open for a long time: bound the
        // connect phase and idle periods rather than the whole transfer
        curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
        curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME, std::max(1L, static_cast<long>(timeout_ms / 1000)));

        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlStreamReader::on_body);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, &CurlStreamReader::on_header);
        curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);

        curl_multi_add_handle(multi_, easy_);
    }

    ~CurlStreamReader() override {
        close();
    }

    /**
     * Drive the transfer until the response headers are complete
     */
    void wait_for_headers() {
        while (!headers_done_ && !finished_) {
            if (signal_ && signal_->is_cancelled()) {
                throw TransportError("Request cancelled", TransportErrorKind::CANCELLED);
            }
            pump();
        }
        raise_if_failed();
        if (!headers_done_) {
            curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status_code_);
        }
    }

    std::optional<std::string> read() override {
        while (pending_.empty() && !finished_) {
            if (signal_ && signal_->is_cancelled()) {
                return std::nullopt;
            }
            pump();
        }

        if (!pending_.empty()) {
            std::string chunk;
            chunk.swap(pending_);
            return chunk;
        }

        raise_if_failed();
        return std::nullopt;
    }

    void close() override {
        if (multi_ && easy_) {
            curl_multi_remove_handle(multi_, easy_);
        }
        if (easy_) {
            curl_easy_cleanup(easy_);
            easy_ = nullptr;
        }
        if (multi_) {
            curl_multi_cleanup(multi_);
            multi_ = nullptr;
        }
        header_list_.reset();
        pending_.clear();
        finished_ = true;
        result_ = CURLE_OK;
    }

    int status_code() const { return static_cast<int>(status_code_); }

    const std::map<std::string, std::string>& headers() const { return headers_; }

private:
    static size_t on_body(char* data, size_t size, size_t nmemb, void* userp) {
        auto* self = static_cast<CurlStreamReader*>(userp);
        self->pending_.append(data, size * nmemb);
        return size * nmemb;
    }

    static size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlStreamReader*>(userdata);
        size_t total_size = size * nitems;
        std::string line(buffer, total_size);

        if (line.rfind("HTTP/", 0) == 0) {
            // New status line (e.g. after "100 Continue"): start over
            self->headers_.clear();
        } else if (line == "\r\n" || line == "\n") {
            long code = 0;
            curl_easy_getinfo(self->easy_, CURLINFO_RESPONSE_CODE, &code);
            if (code >= 200) {
                self->status_code_ = code;
                self->headers_done_ = true;
            }
        } else {
            parse_header_line(line, self->headers_);
        }
        return total_size;
    }

    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            throw TransportError(std::string("CURL multi error: ") + curl_multi_strerror(mc),
                                 TransportErrorKind::OTHER);
        }

        int left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &left)) {
            if (msg->msg == CURLMSG_DONE) {
                finished_ = true;
                result_ = msg->data.result;
            }
        }

        if (!finished_ && pending_.empty()) {
            curl_multi_poll(multi_, nullptr, 0, POLL_INTERVAL_MS, nullptr);
        }
    }

    void raise_if_failed() {
        if (result_ != CURLE_OK) {
            CURLcode code = result_;
            result_ = CURLE_OK;
            throw to_transport_error(code);
        }
    }

    CancellationTokenPtr signal_;
    CURLM* multi_ = nullptr;
    CURL* easy_ = nullptr;
    HeaderList header_list_;
    std::string pending_;
    std::map<std::string, std::string> headers_;
    long status_code_ = 0;
    bool headers_done_ = false;
    bool finished_ = false;
    CURLcode result_ = CURLE_OK;
};

} // namespace

HttpClient::HttpClient(int timeout_ms)
    : timeout_ms_(timeout_ms)
{
    ensure_curl_initialized();
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::send(const RequestDescriptor& request) {
    EasyHandle curl(curl_easy_init());
    if (!curl) {
        throw TransportError("Failed to initialize CURL", TransportErrorKind::OTHER);
    }

    RequestContext ctx(method_to_string(request.method), request.url);
    Logger::get_instance().log_request(ctx, request.headers);

    HeaderList headers = configure_request(curl.get(), request);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));

    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl.get());
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (res != CURLE_OK) {
        throw to_transport_error(res);
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    Logger::get_instance().log_response(ctx, static_cast<int>(status_code), duration);

    HttpResponse response;
    response.status_code = static_cast<int>(status_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);
    response.duration = duration;
    return response;
}

StreamResponse HttpClient::open_stream(const RequestDescriptor& request) {
    RequestContext ctx(method_to_string(request.method), request.url);
    Logger::get_instance().log_request(ctx, request.headers);

    auto start = std::chrono::steady_clock::now();
    auto reader = std::make_unique<CurlStreamReader>(request, timeout_ms_);
    reader->wait_for_headers();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Logger::get_instance().log_response(ctx, reader->status_code(), duration);

    StreamResponse response;
    response.status_code = reader->status_code();
    response.headers = reader->headers();
    response.reader = std::move(reader);
    return response;
}

} // namespace taskstream
