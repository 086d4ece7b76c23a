#include "config.hpp"
#include "util.hpp"
#include "http_client.hpp"
#include "s3_blob_store.hpp"
#include "weather_archiver.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>

int main() {
    // Setup logging
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("main", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    try {
        // 1. Load configuration (.env first, real environment wins)
        int loaded = util::load_dotenv(".env");
        Config config = Config::from_env();
        config.validate();

        if (auto level = util::parse_log_level(config.log_level)) {
            spdlog::set_level(*level);
        } else {
            spdlog::set_level(spdlog::level::info);
            spdlog::warn("Unknown LOG_LEVEL '{}', using 'info'", config.log_level);
        }
        if (loaded > 0) {
            spdlog::debug("Loaded {} variables from .env", loaded);
        }
        spdlog::info("Starting {}...", config.service_name);

        // 2. Clients live for the whole run; the store must go before the SDK session
        AwsSdkSession aws_session;
        RunSummary summary;
        {
            S3BlobStore blob_store;
            CprHttpClient http_client;
            WeatherArchiver archiver(config, http_client, blob_store);

            // 3. Provision the bucket, then archive every city
            archiver.ensure_bucket_exists();
            summary = archiver.run();
        }

        spdlog::info("Archived {} of {} cities ({} fetched).",
                     summary.archived, summary.attempted, summary.fetched);

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Weather archiver finished.");
    return 0;
}
