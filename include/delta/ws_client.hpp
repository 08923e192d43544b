#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace delta {

enum class WsConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Closing
};

using WsOpenCallback = std::function<void()>;
using WsMessageCallback = std::function<void(const std::string& message)>;
using WsErrorCallback = std::function<void(const std::string& error)>;
using WsCloseCallback = std::function<void(int code, const std::string& reason)>;

// One connection attempt. Callbacks fire on the thread that calls run().
class WsSession {
public:
    virtual ~WsSession() = default;

    // Starts connecting. False when the attempt could not even be started.
    virtual bool open() = 0;

    // Services the connection until it closes or close() is called.
    virtual void run() = 0;

    // Only valid from inside a callback on the run() thread.
    virtual bool send(const std::string& message) = 0;

    // Safe from any thread; makes run() return promptly.
    virtual void close() = 0;

    virtual WsConnectionState state() const noexcept = 0;

    void set_open_callback(WsOpenCallback callback) { open_callback_ = std::move(callback); }
    void set_message_callback(WsMessageCallback callback) { message_callback_ = std::move(callback); }
    void set_error_callback(WsErrorCallback callback) { error_callback_ = std::move(callback); }
    void set_close_callback(WsCloseCallback callback) { close_callback_ = std::move(callback); }

protected:
    void notify_open() {
        if (open_callback_) {
            open_callback_();
        }
    }
    void notify_message(const std::string& message) {
        if (message_callback_) {
            message_callback_(message);
        }
    }
    void notify_error(const std::string& error) {
        if (error_callback_) {
            error_callback_(error);
        }
    }
    void notify_close(int code, const std::string& reason) {
        if (close_callback_) {
            close_callback_(code, reason);
        }
    }

private:
    WsOpenCallback open_callback_;
    WsMessageCallback message_callback_;
    WsErrorCallback error_callback_;
    WsCloseCallback close_callback_;
};

struct WsClientOptions {
    std::string url;
    bool insecure = false;          // skip certificate validation
    int ping_interval_s = 30;
    int ping_timeout_s = 5;
};

// libwebsockets-backed session. One context per connection attempt.
class WsClient : public WsSession {
public:
    explicit WsClient(WsClientOptions options);
    ~WsClient() override;

    WsClient(const WsClient&) = delete;
    WsClient& operator=(const WsClient&) = delete;
    WsClient(WsClient&&) noexcept = delete;
    WsClient& operator=(WsClient&&) noexcept = delete;

    bool open() override;
    void run() override;
    bool send(const std::string& message) override;
    void close() override;
    WsConnectionState state() const noexcept override;

    // Public for callback access (implementation detail)
    struct Impl;

private:
    void destroy_context();

    std::unique_ptr<Impl> pimpl_;
};

} // namespace delta
