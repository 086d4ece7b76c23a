#pragma once
#include <string>
#include <vector>

class Config {
public:
    // Service info
    std::string service_name = "weather_archiver";
    std::string log_level = "info";

    // Secrets
    std::string api_key;
    std::string bucket_name;

    // OpenWeather
    std::string weather_api_url = "http://api.openweathermap.org/data/2.5/weather";
    std::string units = "imperial";

    // Cities are processed in this order
    std::vector<std::string> cities = {
        "Atlanta",
        "San Diego",
        "Bahia"
    };

    static Config from_env();
    void validate() const;
};
