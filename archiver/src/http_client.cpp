#include "http_client.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

HttpResponse CprHttpClient::get(const std::string& url, const QueryParams& params) {
    HttpResponse result;

    try {
        cpr::Parameters parameters;
        for (const auto& [key, value] : params) {
            parameters.Add({key, value});
        }

        auto response = cpr::Get(
            cpr::Url{url},
            parameters,
            cpr::Header{{"User-Agent", "WeatherArchiver/1.0"}}
        );

        if (response.error) {
            result.error = response.error.message;
            return result;
        }

        result.status_code = response.status_code;
        result.body = std::move(response.text);

    } catch (const std::exception& e) {
        result.error = e.what();
    }

    return result;
}
