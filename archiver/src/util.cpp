#include "util.hpp"
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <fmt/format.h>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string get_required_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || std::string(value).empty()) {
        throw std::runtime_error("Required environment variable " + name + " is not set");
    }
    return std::string(value);
}

int load_dotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return 0;
    }

    int loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (starts_with(line, "export ")) {
            line = trim(line.substr(7));
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            // Quoted: keep everything up to the closing quote, '#' included
            auto close = value.find(value.front(), 1);
            if (close != std::string::npos) {
                value = value.substr(1, close - 1);
            }
        } else {
            // Unquoted: whitespace then '#' starts a comment
            for (size_t i = 1; i < value.size(); ++i) {
                if (value[i] == '#' && (value[i - 1] == ' ' || value[i - 1] == '\t')) {
                    value = trim(value.substr(0, i));
                    break;
                }
            }
        }

        if (std::getenv(key.c_str()) != nullptr) continue;

        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++loaded;
        }
    }

    return loaded;
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

std::string format_archive_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    localtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y%m%d-%H%M%S");
    return ss.str();
}

std::string format_measurement(double value) {
    // Whole numbers keep one decimal place: 72 -> "72.0"
    auto text = fmt::format("{}", value);
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

std::string describe_storage_error(
    const std::string& exception_name,
    const std::string& message,
    int http_status
) {
    if (exception_name.empty()) {
        // HEAD responses carry no body, so only the status is known
        std::string text = "HTTP " + std::to_string(http_status);
        if (!message.empty()) {
            text += ": " + message;
        }
        return text;
    }
    return message.empty() ? exception_name : exception_name + ": " + message;
}

bool is_http_error(long http_status) {
    return http_status == 0 || http_status >= 400;
}

} // namespace util
