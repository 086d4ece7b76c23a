#pragma once

#include "types.hpp"

// Structural check of an OpenWeather current-weather document.
// Requires main.temp, main.feels_like, main.humidity (numbers) and
// weather[0].description (string).
ExtractionResult extract_fields(const WeatherReading& reading);
