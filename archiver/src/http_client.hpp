#pragma once

#include "types.hpp"
#include <string>

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const QueryParams& params) = 0;
};

// cpr-backed client; one instance is reused for every request.
class CprHttpClient : public HttpClient {
public:
    CprHttpClient() = default;

    HttpResponse get(const std::string& url, const QueryParams& params) override;

    // Non-copyable
    CprHttpClient(const CprHttpClient&) = delete;
    CprHttpClient& operator=(const CprHttpClient&) = delete;
};
