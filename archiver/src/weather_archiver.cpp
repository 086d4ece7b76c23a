#include "weather_archiver.hpp"
#include "weather_fields.hpp"
#include "util.hpp"
#include <variant>

WeatherArchiver::WeatherArchiver(
    const Config& config,
    HttpClient& http_client,
    BlobStore& blob_store,
    std::shared_ptr<spdlog::logger> logger,
    Clock clock)
    : config_(config),
      http_client_(http_client),
      blob_store_(blob_store),
      logger_(std::move(logger)),
      clock_(std::move(clock)) {}

void WeatherArchiver::ensure_bucket_exists() {
    const auto& bucket = config_.bucket_name;
    auto probe = blob_store_.head_bucket(bucket);

    switch (probe.state) {
        case BucketState::Exists:
            logger_->info("Bucket '{}' exists.", bucket);
            return;

        case BucketState::NotFound:
            break;

        case BucketState::Error:
            logger_->error("Error accessing bucket '{}': {} (code {})",
                           bucket, probe.outcome.message, probe.outcome.error_code);
            return;
    }

    logger_->info("Bucket '{}' does not exist. Creating it now...", bucket);

    auto region = blob_store_.region();
    std::optional<std::string> location_constraint;
    if (!region.empty() && region != kDefaultRegion) {
        location_constraint = region;
    }

    auto outcome = blob_store_.create_bucket(bucket, location_constraint);
    if (!outcome.ok) {
        logger_->error("Error creating bucket '{}': {}", bucket, outcome.message);
        return;
    }

    logger_->info("Bucket '{}' created successfully in {}.",
                  bucket, region.empty() ? kDefaultRegion : region);
}

std::optional<WeatherReading> WeatherArchiver::fetch_weather(const std::string& city) {
    try {
        logger_->debug("GET {} for {} (units={})", config_.weather_api_url, city, config_.units);

        auto response = http_client_.get(config_.weather_api_url, {
            {"q", city},
            {"appid", config_.api_key},
            {"units", config_.units}
        });

        if (!response.error.empty()) {
            logger_->error("Error fetching weather data for {}: {}", city, response.error);
            return std::nullopt;
        }

        if (util::is_http_error(response.status_code)) {
            logger_->error("Error fetching weather data for {}: HTTP {} {}",
                           city, response.status_code, response.body);
            return std::nullopt;
        }

        auto reading = nlohmann::json::parse(response.body);
        return std::make_optional(std::move(reading));

    } catch (const std::exception& e) {
        logger_->error("Error fetching weather data for {}: {}", city, e.what());
        return std::nullopt;
    }
}

bool WeatherArchiver::save_to_s3(const WeatherReading& reading, const std::string& city) {
    if (reading.is_null() || reading.empty()) {
        logger_->warn("No weather data to save for {}.", city);
        return false;
    }

    if (!reading.is_object()) {
        logger_->error("Weather data for {} is not a JSON object, not saving.", city);
        return false;
    }

    auto timestamp = util::format_archive_timestamp(clock_());
    auto key = std::string(kKeyPrefix) + city + "-" + timestamp + ".json";

    try {
        WeatherReading document = reading;
        document["timestamp"] = timestamp;

        auto outcome = blob_store_.put_object(config_.bucket_name, key, document.dump(), kContentType);
        if (!outcome.ok) {
            logger_->error("Error saving weather data for {} to S3: {}", city, outcome.message);
            return false;
        }

    } catch (const std::exception& e) {
        logger_->error("Error saving weather data for {} to S3: {}", city, e.what());
        return false;
    }

    logger_->info("Weather data for {} saved to S3 as '{}'.", city, key);
    return true;
}

RunSummary WeatherArchiver::run() {
    RunSummary summary;

    for (const auto& city : config_.cities) {
        process_city(city, summary);
    }

    return summary;
}

void WeatherArchiver::process_city(const std::string& city, RunSummary& summary) {
    ++summary.attempted;
    logger_->info("Fetching weather data for {}...", city);

    auto reading = fetch_weather(city);
    if (!reading) {
        logger_->warn("Failed to fetch weather data for {}.", city);
        return;
    }
    ++summary.fetched;

    auto extracted = extract_fields(*reading);
    if (auto* mismatch = std::get_if<ShapeMismatch>(&extracted)) {
        logger_->warn("Unexpected response structure for {}: {}: {}",
                      city, mismatch->reason, reading->dump());
        return;
    }

    const auto& fields = std::get<ExtractedFields>(extracted);
    auto unit = temperature_unit();
    logger_->info("Temperature: {}{}", util::format_measurement(fields.temp), unit);
    logger_->info("Feels like: {}{}", util::format_measurement(fields.feels_like), unit);
    logger_->info("Humidity: {}%", fields.humidity);
    logger_->info("Conditions: {}", fields.description);

    if (save_to_s3(*reading, city)) {
        ++summary.archived;
    }
}

std::string WeatherArchiver::temperature_unit() const {
    if (config_.units == "metric") return "°C";
    if (config_.units == "standard") return "K";
    return "°F";
}
