#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <spdlog/spdlog.h>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
std::string get_required_env_var(const std::string& name);

// Loads KEY=VALUE pairs from a dotenv file without overriding variables
// that are already set. Returns the number of variables set.
int load_dotenv(const std::string& path);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);

// Time utilities
std::string format_archive_timestamp(const std::chrono::system_clock::time_point& tp);

// Formatting
std::string format_measurement(double value);

// Logging. Empty for names spdlog does not recognise.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

// Storage error text, falling back to the HTTP status when the service
// returned no error body
std::string describe_storage_error(
    const std::string& exception_name,
    const std::string& message,
    int http_status
);

// Network utilities
bool is_http_error(long http_status);

} // namespace util
