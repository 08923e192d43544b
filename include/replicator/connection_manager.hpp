#pragma once

#include "delta/client_base.hpp"
#include "delta/ws_client.hpp"
#include "replicator/event_log.hpp"
#include "replicator/event_router.hpp"
#include "replicator/shutdown.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace replicator {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Authenticating,
    Active,
    Closing
};

const char* to_string(ConnectionState state) noexcept;

struct BackoffSettings {
    double base_s = 1.0;
    double max_s = 60.0;
    double jitter = 0.4;
};

// Reset to base after a session that proved healthy, otherwise double up to
// max. The wait actually slept is backoff x (1 + U(0, jitter)).
class ReconnectBackoff {
public:
    explicit ReconnectBackoff(BackoffSettings settings = {});

    // Advances the policy and returns the jittered wait in seconds.
    double next(bool had_health);

    double current() const noexcept { return current_; }

    const BackoffSettings& settings() const noexcept { return settings_; }

private:
    BackoffSettings settings_;
    double current_;
    std::mt19937_64 rng_;
};

struct ConnectionSettings {
    std::string url;
    delta::Credentials credentials;
    std::string trades_channel = "user_trades";
    bool enable_heartbeat = true;
    BackoffSettings backoff;
};

using WsSessionFactory = std::function<std::unique_ptr<delta::WsSession>()>;

// Owns the socket session lifecycle: connect, authenticate, subscribe,
// heartbeat, reconnect. run() blocks on the calling thread until shutdown.
class ConnectionManager {
public:
    ConnectionManager(ConnectionSettings settings,
                      WsSessionFactory factory,
                      EventRouter& router,
                      EventLog& log,
                      ShutdownCoordinator& shutdown);

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void run();

    // One connect..close cycle. Returns whether the session saw healthy
    // traffic after authenticating.
    bool run_session();

    // Thread-safe; makes the active session's run() return.
    void close_active_session();

    ConnectionState state() const noexcept { return state_.load(); }
    bool authenticated() const noexcept { return authenticated_.load(); }
    std::size_t sessions_started() const noexcept { return sessions_started_.load(); }

    const std::vector<std::string>& channels() const noexcept { return channels_; }

private:
    using Clock = std::chrono::steady_clock;

    void attach(delta::WsSession& session);
    void on_open(delta::WsSession& session);
    void on_message(delta::WsSession& session, const std::string& frame);
    void on_authenticated(delta::WsSession& session);
    void send_frame(delta::WsSession& session, const std::string& frame);
    void set_state(ConnectionState state);

    ConnectionSettings settings_;
    WsSessionFactory factory_;
    EventRouter& router_;
    EventLog& log_;
    ShutdownCoordinator& shutdown_;
    ReconnectBackoff backoff_;
    std::vector<std::string> channels_;

    std::mutex session_mutex_;
    delta::WsSession* active_session_ = nullptr;
    bool hook_registered_ = false;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> authenticated_{false};
    std::atomic<std::size_t> sessions_started_{0};
    Clock::time_point session_start_{};
    Clock::time_point last_health_{Clock::time_point::min()};
};

} // namespace replicator
