#include "delta/client_base.hpp"

#include <algorithm>
#include <iostream>
#include <random>
#include <stdexcept>
#include <thread>
#include <utility>

namespace delta {
namespace {

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

double jitter_factor(double fraction) {
    static thread_local std::mt19937 engine{std::random_device{}()};
    if (fraction <= 0.0) {
        return 1.0;
    }
    std::uniform_real_distribution<double> dist(0.0, fraction);
    return 1.0 + dist(engine);
}

} // namespace

ClientBase::ClientBase(Credentials credentials,
                       ClientOptions options,
                       std::unique_ptr<HttpTransport> transport)
    : credentials_(std::move(credentials)),
      options_(std::move(options)),
      http_client_(std::move(transport)) {
    options_.base_url = strip_trailing_slash(options_.base_url);
    if (!http_client_) {
        http_client_ = std::make_unique<HttpClient>(options_.http);
    }
}

std::string ClientBase::sign(const std::string& secret,
                             const std::string& method,
                             const std::string& timestamp,
                             const std::string& path,
                             const std::string& body) {
    return hmac_sha256_hex(secret, method + timestamp + path + body);
}

bool ClientBase::is_retryable_status(long status) noexcept {
    return status == 429 || (status >= 500 && status < 600);
}

void ClientBase::set_retry_callback(RetryCallback callback) {
    retry_callback_ = std::move(callback);
}

void ClientBase::notify_retry(const RetryNotice& notice) const {
    std::cerr << "[REST] " << notice.method << ' ' << notice.path << " -> "
              << (notice.status_code != 0 ? std::to_string(notice.status_code) : notice.error)
              << ", retry " << notice.attempt << '/' << notice.max_attempts
              << " in " << notice.delay.count() << " ms" << std::endl;
    if (retry_callback_) {
        retry_callback_(notice);
    }
}

HttpResponse ClientBase::attempt_once(const std::string& method,
                                      const std::string& path,
                                      const std::string& body) const {
    if (credentials_.api_key.empty() || credentials_.api_secret.empty()) {
        throw std::invalid_argument("API key and secret are required for signed requests");
    }

    const auto timestamp = std::to_string(unix_timestamp_seconds());
    HeaderList headers = {
        {"api-key", credentials_.api_key},
        {"timestamp", timestamp},
        {"signature", sign(credentials_.api_secret, method, timestamp, path, body)},
        {"User-Agent", options_.user_agent}
    };
    if (!body.empty()) {
        headers.emplace_back("Content-Type", "application/json");
    }

    try {
        return http_client_->request(method, options_.base_url + path, headers, body);
    } catch (const HttpError& ex) {
        if (ex.status_code() == 0) {
            throw;
        }
        return HttpResponse{ex.status_code(), ex.body(), {}};
    }
}

std::chrono::milliseconds ClientBase::retry_delay(int attempt) const {
    const auto& retry = options_.retry;
    double delay_ms = static_cast<double>(retry.base_delay.count());
    for (int i = 1; i < attempt; ++i) {
        delay_ms *= 2.0;
    }
    delay_ms = std::min(delay_ms, static_cast<double>(retry.max_delay.count()));
    delay_ms *= jitter_factor(retry.jitter_fraction);
    return std::chrono::milliseconds(static_cast<long long>(delay_ms));
}

HttpResponse ClientBase::signed_request(const std::string& method,
                                        const std::string& path,
                                        const std::string& body) const {
    const int max_attempts = std::max(1, options_.retry.max_attempts);

    for (int attempt = 1;; ++attempt) {
        try {
            auto response = attempt_once(method, path, body);
            if (attempt >= max_attempts || !is_retryable_status(response.status_code)) {
                return response;
            }
            const auto delay = retry_delay(attempt);
            notify_retry(RetryNotice{method, path, attempt, max_attempts,
                                     response.status_code, {}, delay});
            std::this_thread::sleep_for(delay);
        } catch (const HttpError& ex) {
            if (attempt >= max_attempts) {
                return HttpResponse{0, ex.what(), {}};
            }
            const auto delay = retry_delay(attempt);
            notify_retry(RetryNotice{method, path, attempt, max_attempts, 0, ex.what(), delay});
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace delta
