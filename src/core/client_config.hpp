/**
 * @file client_config.hpp
 * @brief Client configuration loading for the task-execution backend
 *
 * Configuration sources (later sources override earlier ones):
 * 1. Built-in defaults
 * 2. Configuration file: ~/.taskstream/config.json (or an explicit path)
 * 3. Environment variables: TASKSTREAM_API_URL, TASKSTREAM_USER_PROFILING_URL,
 *    TASKSTREAM_MAX_RETRIES, TASKSTREAM_RETRY_DELAY_MS, TASKSTREAM_TIMEOUT_MS,
 *    TASKSTREAM_ACCESS_TOKEN, TASKSTREAM_REFRESH_TOKEN,
 *    TASKSTREAM_CREDENTIALS_PATH, TASKSTREAM_LOG_LEVEL
 */

#ifndef TASKSTREAM_CLIENT_CONFIG_HPP
#define TASKSTREAM_CLIENT_CONFIG_HPP

#include "core/logger.hpp"
#include <map>
#include <stdexcept>
#include <string>

namespace taskstream {

/**
 * @brief Raised for unreadable or malformed configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Path marker routed to the user-profiling service by default
constexpr const char* USER_PROFILING_ROUTE = "/alias_memory_service/user_profiling";

/**
 * @brief Settings shared by every call made through one RequestClient
 */
struct ClientConfig {
    std::string base_url;              ///< Default backend base URL
    int timeout_ms;                    ///< Per-attempt transport timeout
    int max_retries;                   ///< Retries for idempotent verbs (GET, DELETE)
    int retry_delay_ms;                ///< Delay between attempts
    double backoff_multiplier;         ///< 1.0 keeps the delay fixed between attempts
    std::string refresh_path;          ///< Token refresh endpoint, relative to base_url
    std::string credentials_path;      ///< FileCredentialStore location (empty: memory only)
    std::string fixed_access_token;    ///< Fallback when the credential store is empty
    std::string fixed_refresh_token;   ///< Fallback when the credential store is empty
    std::map<std::string, std::string> routes;  ///< Path marker -> base URL override
    LogLevel log_level;

    ClientConfig();

    /**
     * @brief Load defaults, then the config file, then environment overrides
     * @param config_path Explicit config file (must exist); empty uses the
     *        default location when present
     * @throws ConfigError on malformed file or environment values
     */
    static ClientConfig load(const std::string& config_path = "");

    /**
     * @brief Parse a JSON config file on top of `base`
     * @throws ConfigError if the file cannot be read or parsed
     */
    static ClientConfig from_file(const std::string& path,
                                  const ClientConfig& base = ClientConfig());

    /**
     * @brief Apply TASKSTREAM_* environment variables on top of `base`
     * @throws ConfigError if a numeric variable is not a valid number
     */
    static ClientConfig from_environment(const ClientConfig& base = ClientConfig());

    /**
     * @brief Base URL serving `path` (route override or base_url), without trailing slash
     */
    std::string base_url_for(const std::string& path) const;

    /**
     * @brief Full URL for `path`
     */
    std::string url_for(const std::string& path) const;

    /**
     * @brief Sanitized representation for logging (tokens masked)
     */
    std::string to_string() const;

    /**
     * @brief ~/.taskstream (or ./.taskstream when HOME is unset)
     */
    static std::string default_config_dir();
};

} // namespace taskstream

#endif // TASKSTREAM_CLIENT_CONFIG_HPP
