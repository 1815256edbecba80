/**
 * @file client_config.cpp
 * @brief Implementation of ClientConfig loading
 */

#include "core/client_config.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace taskstream {

namespace {

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

int parse_int_env(const char* name, const char* value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size() || parsed < 0) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid value for ") + name + ": expected a non-negative integer");
    }
}

std::string mask(const std::string& token) {
    return Logger::mask_token(token);
}

} // namespace

ClientConfig::ClientConfig()
    : base_url("http://localhost:8000"),
      timeout_ms(60000),
      max_retries(3),
      retry_delay_ms(1000),
      backoff_multiplier(1.0),
      refresh_path("/api/v1/refresh-token"),
      log_level(LogLevel::INFO)
{
    routes[USER_PROFILING_ROUTE] = "http://localhost:6380";
}

ClientConfig ClientConfig::load(const std::string& config_path) {
    ClientConfig config;

    if (!config_path.empty()) {
        config = from_file(config_path, config);
    } else {
        std::string default_path = default_config_dir() + "/config.json";
        if (std::filesystem::exists(default_path)) {
            config = from_file(default_path, config);
        }
    }

    return from_environment(config);
}

ClientConfig ClientConfig::from_file(const std::string& path, const ClientConfig& base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    ClientConfig config = base;

    try {
        json doc = json::parse(file);
        if (!doc.is_object()) {
            throw ConfigError("Config file must contain a JSON object: " + path);
        }

        if (doc.contains("base_url")) config.base_url = doc["base_url"].get<std::string>();
        if (doc.contains("timeout_ms")) config.timeout_ms = doc["timeout_ms"].get<int>();
        if (doc.contains("max_retries")) config.max_retries = doc["max_retries"].get<int>();
        if (doc.contains("retry_delay_ms")) config.retry_delay_ms = doc["retry_delay_ms"].get<int>();
        if (doc.contains("backoff_multiplier")) {
            config.backoff_multiplier = doc["backoff_multiplier"].get<double>();
        }
        if (doc.contains("refresh_path")) config.refresh_path = doc["refresh_path"].get<std::string>();
        if (doc.contains("credentials_path")) {
            config.credentials_path = doc["credentials_path"].get<std::string>();
        }
        if (doc.contains("access_token")) {
            config.fixed_access_token = doc["access_token"].get<std::string>();
        }
        if (doc.contains("refresh_token")) {
            config.fixed_refresh_token = doc["refresh_token"].get<std::string>();
        }
        if (doc.contains("log_level")) {
            config.log_level = string_to_level(doc["log_level"].get<std::string>());
        }
        if (doc.contains("routes")) {
            for (const auto& [marker, url] : doc["routes"].items()) {
                config.routes[marker] = url.get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        std::ostringstream oss;
        oss << "Failed to parse config file " << path << ": " << e.what();
        throw ConfigError(oss.str());
    }

    if (config.max_retries < 0 || config.retry_delay_ms < 0 || config.timeout_ms <= 0) {
        throw ConfigError("Config file " + path + " contains negative retry or timeout values");
    }

    return config;
}

ClientConfig ClientConfig::from_environment(const ClientConfig& base) {
    ClientConfig config = base;

    if (const char* url = std::getenv("TASKSTREAM_API_URL")) {
        config.base_url = url;
    }
    if (const char* url = std::getenv("TASKSTREAM_USER_PROFILING_URL")) {
        config.routes[USER_PROFILING_ROUTE] = url;
    }
    if (const char* value = std::getenv("TASKSTREAM_MAX_RETRIES")) {
        config.max_retries = parse_int_env("TASKSTREAM_MAX_RETRIES", value);
    }
    if (const char* value = std::getenv("TASKSTREAM_RETRY_DELAY_MS")) {
        config.retry_delay_ms = parse_int_env("TASKSTREAM_RETRY_DELAY_MS", value);
    }
    if (const char* value = std::getenv("TASKSTREAM_TIMEOUT_MS")) {
        config.timeout_ms = parse_int_env("TASKSTREAM_TIMEOUT_MS", value);
        // libcurl treats 0 as "no timeout"
        if (config.timeout_ms == 0) {
            throw ConfigError("Invalid value for TASKSTREAM_TIMEOUT_MS: expected a positive integer");
        }
    }
    if (const char* token = std::getenv("TASKSTREAM_ACCESS_TOKEN")) {
        config.fixed_access_token = token;
    }
    if (const char* token = std::getenv("TASKSTREAM_REFRESH_TOKEN")) {
        config.fixed_refresh_token = token;
    }
    if (const char* path = std::getenv("TASKSTREAM_CREDENTIALS_PATH")) {
        config.credentials_path = path;
    }
    if (const char* level = std::getenv("TASKSTREAM_LOG_LEVEL")) {
        config.log_level = string_to_level(level);
    }

    return config;
}

std::string ClientConfig::base_url_for(const std::string& path) const {
    for (const auto& [marker, url] : routes) {
        if (!marker.empty() && path.find(marker) != std::string::npos) {
            return strip_trailing_slash(url);
        }
    }
    return strip_trailing_slash(base_url);
}

std::string ClientConfig::url_for(const std::string& path) const {
    if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) {
        return path;
    }
    std::string base = base_url_for(path);
    if (path.empty() || path.front() == '/') {
        return base + path;
    }
    return base + "/" + path;
}

std::string ClientConfig::to_string() const {
    std::ostringstream oss;
    oss << "ClientConfig{";
    oss << "base_url=" << base_url;
    oss << ", timeout_ms=" << timeout_ms;
    oss << ", max_retries=" << max_retries;
    oss << ", retry_delay_ms=" << retry_delay_ms;
    oss << ", credentials_path=" << (credentials_path.empty() ? "<memory>" : credentials_path);
    if (!fixed_access_token.empty()) {
        oss << ", access_token=" << mask(fixed_access_token);
    }
    if (!fixed_refresh_token.empty()) {
        oss << ", refresh_token=" << mask(fixed_refresh_token);
    }
    oss << ", routes=" << routes.size();
    oss << "}";
    return oss.str();
}

std::string ClientConfig::default_config_dir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");  // Windows
    }
    if (!home) {
        return ".taskstream";
    }
    return std::string(home) + "/.taskstream";
}

} // namespace taskstream
