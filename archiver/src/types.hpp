#pragma once
#include <string>
#include <vector>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

// Raw OpenWeather document; only a few fields are read for display.
using WeatherReading = nlohmann::json;

struct ExtractedFields {
    double temp = 0.0;
    double feels_like = 0.0;
    double humidity = 0.0;
    std::string description;
};

struct ShapeMismatch {
    std::string reason;
};

using ExtractionResult = std::variant<ExtractedFields, ShapeMismatch>;

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error; // transport failure when non-empty
};

enum class BucketState {
    Exists,
    NotFound,
    Error
};

struct StorageOutcome {
    bool ok = false;
    std::string error_code;
    std::string message;
};

struct BucketProbe {
    BucketState state = BucketState::Error;
    StorageOutcome outcome;
};

struct RunSummary {
    int attempted = 0;
    int fetched = 0;
    int archived = 0;
};
