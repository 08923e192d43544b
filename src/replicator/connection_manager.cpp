#include "replicator/connection_manager.hpp"

#include "delta/util.hpp"
#include "delta/ws_frames.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <utility>

namespace replicator {
namespace {

double round_millis(double seconds) {
    return std::round(seconds * 1000.0) / 1000.0;
}

} // namespace

const char* to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Authenticating:
            return "authenticating";
        case ConnectionState::Active:
            return "active";
        case ConnectionState::Closing:
            break;
    }
    return "closing";
}

ReconnectBackoff::ReconnectBackoff(BackoffSettings settings)
    : settings_(settings),
      current_(settings.base_s),
      rng_(std::random_device{}()) {}

double ReconnectBackoff::next(bool had_health) {
    current_ = had_health ? settings_.base_s : std::min(current_ * 2.0, settings_.max_s);
    const double jitter = std::max(0.0, settings_.jitter);
    std::uniform_real_distribution<double> dist(0.0, jitter);
    return current_ * (1.0 + (jitter > 0.0 ? dist(rng_) : 0.0));
}

ConnectionManager::ConnectionManager(ConnectionSettings settings,
                                     WsSessionFactory factory,
                                     EventRouter& router,
                                     EventLog& log,
                                     ShutdownCoordinator& shutdown)
    : settings_(std::move(settings)),
      factory_(std::move(factory)),
      router_(router),
      log_(log),
      shutdown_(shutdown),
      backoff_(settings_.backoff),
      channels_{"orders", "positions", settings_.trades_channel} {}

void ConnectionManager::set_state(ConnectionState state) {
    state_.store(state);
}

void ConnectionManager::run() {
    if (!hook_registered_) {
        hook_registered_ = true;
        shutdown_.add_stop_hook([this] { close_active_session(); });
    }

    while (!shutdown_.stop_requested()) {
        const bool had_health = run_session();
        if (shutdown_.stop_requested()) {
            break;
        }

        const double wait = backoff_.next(had_health);
        log_.action("reconnect_wait", {{"seconds", round_millis(wait)}, {"had_health", had_health}});
        std::cout << "[WS] Reconnecting in " << std::fixed << std::setprecision(2) << wait << "s"
                  << std::defaultfloat << std::endl;
        if (shutdown_.wait_for(std::chrono::duration<double>(wait))) {
            break;
        }
    }
    set_state(ConnectionState::Disconnected);
    std::cout << "[WS] Connection loop stopped" << std::endl;
}

bool ConnectionManager::run_session() {
    session_start_ = Clock::now();
    authenticated_ = false;
    set_state(ConnectionState::Connecting);

    std::unique_ptr<delta::WsSession> session;
    try {
        session = factory_();
    } catch (const std::exception& ex) {
        std::cerr << "[WS] Failed to create session: " << ex.what() << std::endl;
        log_.event("error", {{"error", ex.what()}});
    }
    if (!session) {
        set_state(ConnectionState::Disconnected);
        return false;
    }

    attach(*session);
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        active_session_ = session.get();
    }
    ++sessions_started_;

    if (shutdown_.stop_requested()) {
        std::lock_guard<std::mutex> lock(session_mutex_);
        active_session_ = nullptr;
        set_state(ConnectionState::Disconnected);
        return false;
    }

    std::cout << "[WS] Connecting to " << settings_.url << std::endl;
    if (session->open()) {
        session->run();
    } else {
        std::cerr << "[WS] Failed to start connection to " << settings_.url << std::endl;
        log_.event("error", {{"error", "open_failed"}, {"url", settings_.url}});
    }

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        active_session_ = nullptr;
    }
    authenticated_ = false;
    set_state(ConnectionState::Disconnected);
    return last_health_ >= session_start_;
}

void ConnectionManager::close_active_session() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (active_session_ != nullptr) {
        set_state(ConnectionState::Closing);
        active_session_->close();
    }
}

void ConnectionManager::attach(delta::WsSession& session) {
    session.set_open_callback([this, &session] { on_open(session); });
    session.set_message_callback([this, &session](const std::string& frame) { on_message(session, frame); });
    session.set_error_callback([this](const std::string& error) {
        std::cerr << "[WS] Socket error: " << error << std::endl;
        log_.event("error", {{"error", error}});
    });
    session.set_close_callback([this](int code, const std::string& reason) {
        std::cout << "[WS] Socket closed code=" << code << " reason=" << reason << std::endl;
        log_.event("close", {{"code", code}, {"reason", reason}});
    });
}

void ConnectionManager::send_frame(delta::WsSession& session, const std::string& frame) {
    if (!session.send(frame)) {
        std::cerr << "[WS] Failed to send frame" << std::endl;
        log_.event("warn", {{"error", "send_failed"}});
    }
}

void ConnectionManager::on_open(delta::WsSession& session) {
    std::cout << "[WS] Socket opened; authenticating" << std::endl;
    log_.event("open", {{"url", settings_.url}});
    set_state(ConnectionState::Authenticating);

    const auto timestamp = std::to_string(delta::unix_timestamp_seconds());
    send_frame(session, delta::build_auth_frame(settings_.credentials, timestamp));
    log_.action("auth_send", {{"timestamp", timestamp}});
}

void ConnectionManager::on_authenticated(delta::WsSession& session) {
    last_health_ = Clock::now();
    authenticated_ = true;

    for (const auto& channel : channels_) {
        log_.action("subscribe", {{"channel", channel}, {"symbols", nlohmann::json::array({"all"})}});
        send_frame(session, delta::build_subscribe_frame(channel));
    }
    std::cout << "[WS] Authenticated. Subscribed to orders/positions/" << settings_.trades_channel << std::endl;
    log_.event("subscriptions", {{"ok", true}, {"channels", channels_}});

    if (settings_.enable_heartbeat) {
        send_frame(session, delta::build_enable_heartbeat_frame());
    }
    set_state(ConnectionState::Active);
}

void ConnectionManager::on_message(delta::WsSession& session, const std::string& frame) {
    const auto kind = router_.route(frame);
    switch (kind) {
        case FrameKind::AuthSuccess:
            on_authenticated(session);
            return;
        case FrameKind::Malformed:
            return;
        default:
            break;
    }
    if (authenticated_) {
        last_health_ = Clock::now();
    }
}

} // namespace replicator
