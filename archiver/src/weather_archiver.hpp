#pragma once

#include "config.hpp"
#include "types.hpp"
#include "http_client.hpp"
#include "blob_store.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

class WeatherArchiver {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr const char* kDefaultRegion = "us-east-1";
    static constexpr const char* kKeyPrefix = "weather-data/";
    static constexpr const char* kContentType = "application/json";

    WeatherArchiver(
        const Config& config,
        HttpClient& http_client,
        BlobStore& blob_store,
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger(),
        Clock clock = std::chrono::system_clock::now
    );

    // Creates the bucket when the probe reports it missing. Never throws.
    void ensure_bucket_exists();

    // Empty on transport failure, HTTP error status or unparseable body
    std::optional<WeatherReading> fetch_weather(const std::string& city);

    // Injects a timestamp and writes weather-data/{city}-{timestamp}.json.
    // A null or empty reading is rejected without a write.
    bool save_to_s3(const WeatherReading& reading, const std::string& city);

    // Fetch, display and archive every configured city in order
    RunSummary run();

    // Non-copyable
    WeatherArchiver(const WeatherArchiver&) = delete;
    WeatherArchiver& operator=(const WeatherArchiver&) = delete;

private:
    void process_city(const std::string& city, RunSummary& summary);
    std::string temperature_unit() const;

    const Config& config_;
    HttpClient& http_client_;
    BlobStore& blob_store_;
    std::shared_ptr<spdlog::logger> logger_;
    Clock clock_;
};
