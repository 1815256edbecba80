#pragma once

#include "core/cancellation.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace taskstream {

/**
 * HTTP verbs supported by the client
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE
};

inline std::string method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        default: return "UNKNOWN";
    }
}

/**
 * One outgoing call. Immutable per attempt: a retry or an auth replay
 * re-sends the same descriptor with a freshly attached credential.
 */
struct RequestDescriptor {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::optional<std::string> body;
    std::map<std::string, std::string> headers;
    CancellationTokenPtr signal;
};

/**
 * HTTP response structure
 */
struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds duration{0};
};

/**
 * HTTP client error (non-2xx status or unusable response)
 */
class HttpClientError : public std::runtime_error {
public:
    HttpClientError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * Human-readable message for an error status
 */
std::string describe_http_status(int status_code, const std::string& body);

/**
 * Transport failure classification
 */
enum class TransportErrorKind {
    TIMEOUT,      ///< Attempt exceeded its timeout
    CONNECTION,   ///< Connect failure, reset, empty or truncated reply
    CANCELLED,    ///< Aborted because the cancellation token fired
    OTHER         ///< Anything else (bad URL, TLS setup, ...)
};

/**
 * Failure below the HTTP layer: no usable status was received
 */
class TransportError : public HttpClientError {
public:
    TransportError(const std::string& message, TransportErrorKind kind)
        : HttpClientError(message, 0), kind_(kind) {}

    TransportErrorKind kind() const { return kind_; }

    /**
     * Timeouts and connection resets are retried; everything else is surfaced
     */
    bool is_transient() const {
        return kind_ == TransportErrorKind::TIMEOUT || kind_ == TransportErrorKind::CONNECTION;
    }

private:
    TransportErrorKind kind_;
};

/**
 * Pull-based body reader for a streaming response.
 *
 * Owns the underlying connection; destroying the reader releases it.
 */
class StreamReader {
public:
    virtual ~StreamReader() = default;

    /**
     * Block until the next chunk of body bytes arrives
     * @return the chunk, or std::nullopt at end of stream or when the
     *         request's cancellation token fired
     * @throws TransportError on a failed read
     */
    virtual std::optional<std::string> read() = 0;

    /**
     * Release the connection. Further read() calls return std::nullopt.
     */
    virtual void close() = 0;
};

/**
 * Response headers of a streaming call plus the reader for its body
 */
struct StreamResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::unique_ptr<StreamReader> reader;
};

/**
 * Transport seam between the request client and the network
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Perform a plain call and return the full response, whatever its status
     * @throws TransportError when no response was received
     */
    virtual HttpResponse send(const RequestDescriptor& request) = 0;

    /**
     * Issue a streaming call and return once response headers are received
     * @throws TransportError when no response headers were received
     */
    virtual StreamResponse open_stream(const RequestDescriptor& request) = 0;
};

} // namespace taskstream
