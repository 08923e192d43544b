#pragma once

#include "delta/util.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace delta {

struct RequestTimings {
    double name_lookup_ms = 0.0;
    double connect_ms = 0.0;
    double app_connect_ms = 0.0;
    double start_transfer_ms = 0.0;
    double total_ms = 0.0;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
    RequestTimings timings;
};

// status_code is 0 when the request never produced an HTTP response.
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message, long status_code = 0, std::string body = {})
        : std::runtime_error(message), status_code_(status_code), body_(std::move(body)) {}

    [[nodiscard]] long status_code() const noexcept { return status_code_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }

private:
    long status_code_;
    std::string body_;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Throws HttpError on transport failure or on a status >= 400.
    virtual HttpResponse request(
        const std::string& method,
        const std::string& url,
        const HeaderList& headers = {},
        const std::string& body = "") const = 0;
};

struct HttpClientOptions {
    long connect_timeout_ms = 3050;
    long read_timeout_ms = 10000;
};

class HttpClient : public HttpTransport {
public:
    explicit HttpClient(HttpClientOptions options = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept = delete;
    HttpClient& operator=(HttpClient&&) noexcept = delete;

    HttpResponse request(
        const std::string& method,
        const std::string& url,
        const HeaderList& headers = {},
        const std::string& body = "") const override;

private:
    RequestTimings collect_timings(CURL* handle) const;

    HttpClientOptions options_;
    bool global_initialized_;
};

} // namespace delta
