#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

Config Config::from_env() {
    Config config;

    // Secrets
    config.api_key = util::get_required_env_var("OPENWEATHER_API_KEY");
    config.bucket_name = util::get_required_env_var("AWS_BUCKET_NAME");

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = util::get_env_var("LOG_LEVEL", config.log_level);

    // OpenWeather
    config.weather_api_url = util::get_env_var("OPENWEATHER_API_URL", config.weather_api_url);
    config.units = util::get_env_var("WEATHER_UNITS", config.units);

    // Cities (comma-separated, order preserved)
    std::string cities_str = util::get_env_var("WEATHER_CITIES");
    if (!cities_str.empty()) {
        config.cities.clear();
        for (const auto& city : util::split_string(cities_str, ',')) {
            auto trimmed = util::trim(city);
            if (!trimmed.empty()) {
                config.cities.push_back(trimmed);
            }
        }
    }

    return config;
}

void Config::validate() const {
    if (api_key.empty()) {
        throw std::runtime_error("OPENWEATHER_API_KEY is required");
    }

    if (bucket_name.empty()) {
        throw std::runtime_error("AWS_BUCKET_NAME is required");
    }

    if (weather_api_url.empty()) {
        throw std::runtime_error("OpenWeather API URL must not be empty");
    }

    if (cities.empty()) {
        throw std::runtime_error("At least one city is required");
    }

    spdlog::info("Configuration validated successfully");
}
