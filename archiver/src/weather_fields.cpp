#include "weather_fields.hpp"

namespace {

bool read_number(const nlohmann::json& obj, const char* name, double& out) {
    auto it = obj.find(name);
    if (it == obj.end() || !it->is_number()) {
        return false;
    }
    out = it->get<double>();
    return true;
}

} // namespace

ExtractionResult extract_fields(const WeatherReading& reading) {
    if (!reading.is_object()) {
        return ShapeMismatch{"response is not a JSON object"};
    }

    auto main_it = reading.find("main");
    if (main_it == reading.end() || !main_it->is_object()) {
        return ShapeMismatch{"missing 'main' object"};
    }

    ExtractedFields fields;
    if (!read_number(*main_it, "temp", fields.temp)) {
        return ShapeMismatch{"missing numeric 'main.temp'"};
    }
    if (!read_number(*main_it, "feels_like", fields.feels_like)) {
        return ShapeMismatch{"missing numeric 'main.feels_like'"};
    }
    if (!read_number(*main_it, "humidity", fields.humidity)) {
        return ShapeMismatch{"missing numeric 'main.humidity'"};
    }

    auto weather_it = reading.find("weather");
    if (weather_it == reading.end() || !weather_it->is_array() || weather_it->empty()) {
        return ShapeMismatch{"missing non-empty 'weather' array"};
    }

    const auto& condition = weather_it->front();
    if (!condition.is_object()) {
        return ShapeMismatch{"'weather[0]' is not an object"};
    }

    auto desc_it = condition.find("description");
    if (desc_it == condition.end() || !desc_it->is_string()) {
        return ShapeMismatch{"missing string 'weather[0].description'"};
    }
    fields.description = desc_it->get<std::string>();

    return fields;
}
