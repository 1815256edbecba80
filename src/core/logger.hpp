/**
 * @file logger.hpp
 * @brief Structured request/stream event log for taskstream
 *
 * One process-wide Logger receives typed events (request sent, retry
 * scheduled, token refresh, malformed frame, session state change) and
 * writes them as JSON lines or plain text to stderr and/or a file.
 * Bearer and refresh tokens are masked before any sink sees them.
 */

#ifndef TASKSTREAM_LOGGER_HPP
#define TASKSTREAM_LOGGER_HPP

#include <cctype>
#include <chrono>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace taskstream {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (headers, frame payloads)
    INFO,    ///< Informational messages (request sent, session completed)
    WARN,    ///< Warning messages (retries, decode errors)
    ERROR    ///< Error messages (failed calls, failed sessions)
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name, case-insensitive ("warning" accepted for WARN)
 * @return INFO for unrecognised names
 */
inline LogLevel string_to_level(const std::string& name) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Request context attached to every request-scoped log event
 */
struct RequestContext {
    std::string method;      ///< HTTP verb
    std::string url;         ///< Full request URL
    int attempt;             ///< 1-based attempt number
    std::string session_id;  ///< Stream session identifier (empty for plain calls)

    RequestContext() : attempt(0) {}

    RequestContext(const std::string& m, const std::string& u)
        : method(m), url(u), attempt(0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)
    size_t max_payload_log_bytes;    ///< Truncate logged frame payloads beyond this size

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("taskstream.log"),
          enable_json(true),
          max_payload_log_bytes(512) {}
};

/**
 * @brief Process-wide event log shared by every client, session and refresher
 *
 * All methods are thread-safe. Events below the configured level are dropped
 * before formatting.
 *
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_json = false;
 *   Logger::get_instance().configure(config);
 *
 *   RequestContext ctx("POST", "http://localhost:8000/api/v1/conversations/7/chat");
 *   ctx.session_id = "stream-1";
 *   Logger::get_instance().log_state_transition(ctx.session_id, "CONNECTING", "STREAMING");
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log an outgoing request (Authorization header is masked)
     */
    void log_request(const RequestContext& ctx,
                     const std::map<std::string, std::string>& headers);

    /**
     * @brief Log a received response status
     */
    void log_response(const RequestContext& ctx, int status_code,
                      std::chrono::milliseconds duration);

    /**
     * @brief Log a scheduled retry after a transient failure
     */
    void log_retry(const RequestContext& ctx, int max_attempts,
                   std::chrono::milliseconds delay, const std::string& reason);

    /**
     * @brief Log a token refresh outcome
     *
     * @param refresh_token Refresh token used (masked in output)
     * @param success Whether the refresh endpoint accepted it
     * @param detail Failure reason or "shared" when joined to an in-flight refresh
     */
    void log_token_refresh(const std::string& refresh_token, bool success,
                           const std::string& detail = "");

    /**
     * @brief Log a malformed stream frame
     */
    void log_decode_error(const std::string& session_id, const std::string& raw,
                          const std::string& cause);

    /**
     * @brief Log stream session state transition
     */
    void log_state_transition(const std::string& session_id,
                              const std::string& old_state,
                              const std::string& new_state);

    /**
     * @brief Log error with context
     */
    void log_error(const RequestContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const std::string& warning_message,
                     const std::map<std::string, std::string>& fields = {});

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    /**
     * @brief Mask token for safe logging (show first/last 4 chars)
     */
    static std::string mask_token(const std::string& token);

private:
    Logger();
    ~Logger();

    // Singleton: non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message,
             const std::map<std::string, std::string>& fields);
    void add_context(std::map<std::string, std::string>& fields,
                     const RequestContext& ctx) const;
    std::string truncate(const std::string& text) const;
    std::string timestamp() const;
    void emit(const std::string& output);
};

} // namespace taskstream

#endif // TASKSTREAM_LOGGER_HPP
