#pragma once

#include "delta/http_client.hpp"
#include "delta/util.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace delta {

struct Credentials {
    std::string api_key;
    std::string api_secret;
};

// Applied to 429, 5xx and transport failures only.
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{4000};
    double jitter_fraction = 0.25;
};

struct RetryNotice {
    std::string method;
    std::string path;
    int attempt = 0;
    int max_attempts = 0;
    long status_code = 0;       // 0 for transport failures
    std::string error;
    std::chrono::milliseconds delay{0};
};

using RetryCallback = std::function<void(const RetryNotice&)>;

struct ClientOptions {
    std::string base_url = "https://api.india.delta.exchange";
    std::string user_agent = "delta-topup-replicator";
    HttpClientOptions http;
    RetryPolicy retry;
};

class ClientBase {
public:
    explicit ClientBase(Credentials credentials,
                        ClientOptions options = {},
                        std::unique_ptr<HttpTransport> transport = nullptr);
    virtual ~ClientBase() = default;

    ClientBase(const ClientBase&) = delete;
    ClientBase& operator=(const ClientBase&) = delete;

    // Delta request signature: hex(HMAC-SHA256(secret, method + timestamp + path + body)).
    static std::string sign(const std::string& secret,
                            const std::string& method,
                            const std::string& timestamp,
                            const std::string& path,
                            const std::string& body = "");

    static bool is_retryable_status(long status) noexcept;

    void set_retry_callback(RetryCallback callback);

protected:
    // Never throws for HTTP or transport failures: once retries are exhausted the
    // last status is returned, with status 0 and the error text for transport errors.
    HttpResponse signed_request(const std::string& method,
                                const std::string& path,
                                const std::string& body = "") const;

    const ClientOptions& options() const noexcept { return options_; }

private:
    HttpResponse attempt_once(const std::string& method,
                              const std::string& path,
                              const std::string& body) const;
    std::chrono::milliseconds retry_delay(int attempt) const;
    void notify_retry(const RetryNotice& notice) const;

    Credentials credentials_;
    ClientOptions options_;
    std::unique_ptr<HttpTransport> http_client_;
    RetryCallback retry_callback_;
};

} // namespace delta
