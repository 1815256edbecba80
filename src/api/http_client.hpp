#pragma once

#include "api/http_transport.hpp"
#include <string>

namespace taskstream {

/**
 * libcurl-backed HttpTransport
 *
 * Features:
 * - One easy handle per request, so plain calls may run concurrently
 * - Per-attempt timeout (total transfer time for plain calls; connect plus
 *   idle timeout for streaming calls)
 * - Streaming bodies pulled chunk by chunk through the curl multi interface
 * - Cancellation token polled while waiting for network progress
 * - Request/response logging at DEBUG level with the bearer token masked
 */
class HttpClient : public HttpTransport {
public:
    /**
     * Constructor
     * @param timeout_ms Per-attempt timeout in milliseconds (default: 60000)
     */
    explicit HttpClient(int timeout_ms = 60000);

    ~HttpClient() override;

    HttpResponse send(const RequestDescriptor& request) override;

    StreamResponse open_stream(const RequestDescriptor& request) override;

    int timeout_ms() const { return timeout_ms_; }

private:
    int timeout_ms_;
};

} // namespace taskstream
