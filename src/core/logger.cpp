/**
 * @file logger.cpp
 * @brief Formatting and sinks for the taskstream event log
 */

#include "core/logger.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace taskstream {

namespace {

// Plain-text values are quoted when they would break key=value parsing
std::string plain_value(const std::string& value) {
    if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted + "\"";
}

} // namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    bool file_failed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
        file_stream_.reset();

        if (config_.enable_file) {
            auto stream = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
            if (stream->is_open()) {
                file_stream_ = std::move(stream);
            } else {
                file_failed = true;
            }
        }
    }

    if (file_failed) {
        log_warning("Log file could not be opened, file sink disabled",
                    {{"path", config.log_file_path}});
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log_request(
    const RequestContext& ctx,
    const std::map<std::string, std::string>& headers
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "request";
    add_context(fields, ctx);

    for (const auto& [key, value] : headers) {
        if (key == "Authorization") {
            // "Bearer <token>" -> keep the scheme, mask the credential
            auto space = value.find(' ');
            fields["header." + key] = space == std::string::npos
                ? mask_token(value)
                : value.substr(0, space + 1) + mask_token(value.substr(space + 1));
        } else {
            fields["header." + key] = value;
        }
    }

    log(LogLevel::DEBUG, "Sending request", fields);
}

void Logger::log_response(
    const RequestContext& ctx,
    int status_code,
    std::chrono::milliseconds duration
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "response";
    add_context(fields, ctx);
    fields["status_code"] = std::to_string(status_code);
    fields["duration_ms"] = std::to_string(duration.count());

    log(LogLevel::DEBUG, "Received response", fields);
}

void Logger::log_retry(
    const RequestContext& ctx,
    int max_attempts,
    std::chrono::milliseconds delay,
    const std::string& reason
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "retry";
    add_context(fields, ctx);
    fields["max_attempts"] = std::to_string(max_attempts);
    fields["delay_ms"] = std::to_string(delay.count());
    fields["reason"] = reason;

    log(LogLevel::WARN, "Transient failure, retrying", fields);
}

void Logger::log_token_refresh(
    const std::string& refresh_token,
    bool success,
    const std::string& detail
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "token_refresh";
    fields["refresh_token"] = mask_token(refresh_token);
    fields["success"] = success ? "true" : "false";
    if (!detail.empty()) {
        fields["detail"] = detail;
    }

    log(success ? LogLevel::INFO : LogLevel::ERROR,
        success ? "Access token refreshed" : "Access token refresh failed", fields);
}

void Logger::log_decode_error(
    const std::string& session_id,
    const std::string& raw,
    const std::string& cause
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "decode_error";
    fields["session_id"] = session_id;
    fields["raw"] = truncate(raw);
    fields["cause"] = cause;

    log(LogLevel::WARN, "Malformed stream frame skipped", fields);
}

void Logger::log_state_transition(
    const std::string& session_id,
    const std::string& old_state,
    const std::string& new_state
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "state_transition";
    fields["session_id"] = session_id;
    fields["old_state"] = old_state;
    fields["new_state"] = new_state;

    log(LogLevel::DEBUG, "State transition", fields);
}

void Logger::log_error(const RequestContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Request failed", fields);
}

void Logger::log_warning(
    const std::string& warning_message,
    const std::map<std::string, std::string>& extra
) {
    std::map<std::string, std::string> fields = extra;
    fields["event"] = "warning";

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

std::string Logger::mask_token(const std::string& token) {
    if (token.empty()) {
        return "<empty>";
    }
    if (token.size() <= 8) {
        return "****";
    }
    return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
}

void Logger::add_context(
    std::map<std::string, std::string>& fields,
    const RequestContext& ctx
) const {
    fields["method"] = ctx.method;
    fields["url"] = ctx.url;
    if (ctx.attempt > 0) {
        fields["attempt"] = std::to_string(ctx.attempt);
    }
    if (!ctx.session_id.empty()) {
        fields["session_id"] = ctx.session_id;
    }
}

std::string Logger::truncate(const std::string& text) const {
    if (text.size() <= config_.max_payload_log_bytes) {
        return text;
    }
    return text.substr(0, config_.max_payload_log_bytes) + "...(truncated)";
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string line;
    if (config_.enable_json) {
        nlohmann::json record(fields);
        record["timestamp"] = timestamp();
        record["level"] = level_to_string(level);
        record["message"] = message;
        // Frame payloads may carry invalid UTF-8; never let logging throw
        line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else {
        // logfmt-style: <time> <LEVEL> <message> key=value ...
        std::ostringstream oss;
        oss << timestamp() << ' ' << std::left << std::setw(5) << level_to_string(level)
            << ' ' << message;
        for (const auto& [key, value] : fields) {
            oss << ' ' << key << '=' << plain_value(value);
        }
        line = oss.str();
    }

    emit(line);
}

// UTC, ISO-8601 with milliseconds: 2024-06-11T08:15:30.042Z
std::string Logger::timestamp() const {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t seconds = system_clock::to_time_t(now);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

void Logger::emit(const std::string& line) {
    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_stream_) {
        // Flushed per line so a crash never loses the events leading up to it
        *file_stream_ << line << std::endl;
    }
}

} // namespace taskstream
