#include "delta/ws_client.hpp"

#include <libwebsockets.h>

#include <cstring>
#include <deque>
#include <stdexcept>
#include <vector>

namespace delta {

struct WsClient::Impl {
    WsClient* owner = nullptr;
    WsClientOptions options;
    ::lws_context* context = nullptr;
    ::lws* wsi = nullptr;
    ::lws_retry_bo_t retry_policy{};

    std::atomic<bool> should_stop{false};
    std::atomic<bool> finished{false};
    std::atomic<WsConnectionState> state{WsConnectionState::Disconnected};
    bool close_notified = false;
    int close_code = 0;
    std::string close_reason;

    std::mutex context_mutex;
    std::mutex send_mutex;
    std::deque<std::string> send_queue;
    std::string message_buffer; // For fragmented text messages

    void on_established() {
        state = WsConnectionState::Connected;
        owner->notify_open();
    }

    void on_text(const std::string& message) { owner->notify_message(message); }

    void on_error(const std::string& error) {
        close_reason = error;
        owner->notify_error(error);
    }

    void on_closed() {
        finished = true;
        wsi = nullptr;
        state = WsConnectionState::Disconnected;
    }

    void notify_closed_once() {
        if (close_notified) {
            return;
        }
        close_notified = true;
        owner->notify_close(close_code, close_reason);
    }
};

} // namespace delta

namespace {

int callback_ws_client(struct lws* wsi, enum lws_callback_reasons reason,
                       void* user, void* in, size_t len) {
    (void)user;
    auto* impl = static_cast<delta::WsClient::Impl*>(lws_get_opaque_user_data(wsi));
    if (!impl) {
        impl = static_cast<delta::WsClient::Impl*>(lws_context_user(lws_get_context(wsi)));
        if (!impl) {
            return 0;
        }
    }

    switch (reason) {
        case LWS_CALLBACK_CLIENT_ESTABLISHED:
            impl->on_established();
            break;

        case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
            std::string error_msg = "Connection error";
            if (in && len > 0) {
                error_msg.assign(static_cast<const char*>(in), len);
            } else if (in) {
                error_msg = static_cast<const char*>(in);
            }
            impl->on_error(error_msg);
            impl->on_closed();
            break;
        }

        case LWS_CALLBACK_WS_PEER_INITIATED_CLOSE:
            if (in && len >= 2) {
                const auto* bytes = static_cast<const unsigned char*>(in);
                impl->close_code = (bytes[0] << 8) | bytes[1];
                impl->close_reason.assign(reinterpret_cast<const char*>(bytes + 2), len - 2);
            }
            break;

        case LWS_CALLBACK_CLIENT_CLOSED:
        case LWS_CALLBACK_CLOSED:
            impl->on_closed();
            break;

        case LWS_CALLBACK_CLIENT_RECEIVE: {
            // Binary frames carry nothing we consume.
            if (in && len > 0 && !lws_frame_is_binary(wsi)) {
                impl->message_buffer.append(static_cast<const char*>(in), len);
                if (lws_is_final_fragment(wsi)) {
                    const std::string message = std::move(impl->message_buffer);
                    impl->message_buffer.clear();
                    impl->on_text(message);
                }
            }
            break;
        }

        case LWS_CALLBACK_CLIENT_WRITEABLE: {
            if (impl->should_stop) {
                return -1;
            }
            std::string message;
            bool more = false;
            {
                std::lock_guard<std::mutex> lock(impl->send_mutex);
                if (impl->send_queue.empty()) {
                    break;
                }
                message = std::move(impl->send_queue.front());
                impl->send_queue.pop_front();
                more = !impl->send_queue.empty();
            }

            std::vector<unsigned char> buf(LWS_PRE + message.size());
            std::memcpy(buf.data() + LWS_PRE, message.data(), message.size());

            const int n = lws_write(wsi, buf.data() + LWS_PRE, message.size(), LWS_WRITE_TEXT);
            if (n < static_cast<int>(message.size())) {
                impl->on_error("Failed to send WebSocket message");
                return -1;
            }
            if (more) {
                lws_callback_on_writable(wsi);
            }
            break;
        }

        default:
            break;
    }

    return 0;
}

const struct lws_protocols protocols[] = {
    {
        "ws-client",
        callback_ws_client,
        0,
        65536, // rx_buffer_size
    },
    {nullptr, nullptr, 0, 0}
};

struct ParsedUrl {
    bool ssl = false;
    std::string host;
    std::string path = "/";
    int port = 0;
};

bool parse_ws_url(const std::string& url, ParsedUrl& out) {
    std::size_t start = 0;
    if (url.rfind("wss://", 0) == 0) {
        out.ssl = true;
        out.port = 443;
        start = 6;
    } else if (url.rfind("ws://", 0) == 0) {
        out.ssl = false;
        out.port = 80;
        start = 5;
    } else {
        return false;
    }

    const std::size_t slash = url.find('/', start);
    if (slash == std::string::npos) {
        out.host = url.substr(start);
    } else {
        out.host = url.substr(start, slash - start);
        out.path = url.substr(slash);
    }

    const std::size_t colon = out.host.find(':');
    if (colon != std::string::npos) {
        try {
            out.port = std::stoi(out.host.substr(colon + 1));
        } catch (const std::exception&) {
            return false;
        }
        out.host = out.host.substr(0, colon);
    }
    return !out.host.empty();
}

} // anonymous namespace

namespace delta {

WsClient::WsClient(WsClientOptions options)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->owner = this;
    pimpl_->options = std::move(options);
}

WsClient::~WsClient() {
    close();
    destroy_context();
}

bool WsClient::open() {
    if (pimpl_->context) {
        return false;
    }

    ParsedUrl url;
    if (!parse_ws_url(pimpl_->options.url, url)) {
        pimpl_->on_error("Unsupported WebSocket URL: " + pimpl_->options.url);
        return false;
    }

    pimpl_->state = WsConnectionState::Connecting;

    // Protocol-level keepalive: ping after ping_interval of silence, hang up
    // when nothing valid arrives within ping_timeout after that.
    pimpl_->retry_policy.secs_since_valid_ping =
        static_cast<uint16_t>(pimpl_->options.ping_interval_s);
    pimpl_->retry_policy.secs_since_valid_hangup =
        static_cast<uint16_t>(pimpl_->options.ping_interval_s + pimpl_->options.ping_timeout_s);

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));

    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    info.user = pimpl_.get(); // Store impl in context user data

    {
        std::lock_guard<std::mutex> lock(pimpl_->context_mutex);
        pimpl_->context = lws_create_context(&info);
    }
    if (!pimpl_->context) {
        pimpl_->state = WsConnectionState::Disconnected;
        pimpl_->on_error("Failed to create libwebsockets context");
        return false;
    }

    struct lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof(ccinfo));
    ccinfo.context = pimpl_->context;
    ccinfo.address = url.host.c_str();
    ccinfo.port = url.port;
    ccinfo.path = url.path.c_str();
    ccinfo.host = url.host.c_str();
    ccinfo.origin = url.host.c_str();
    ccinfo.protocol = protocols[0].name;
    ccinfo.retry_and_idle_policy = &pimpl_->retry_policy;
    if (url.ssl) {
        ccinfo.ssl_connection = LCCSCF_USE_SSL;
        if (pimpl_->options.insecure) {
            ccinfo.ssl_connection |= LCCSCF_ALLOW_SELFSIGNED |
                                     LCCSCF_SKIP_SERVER_CERT_HOSTNAME_CHECK |
                                     LCCSCF_ALLOW_EXPIRED |
                                     LCCSCF_ALLOW_INSECURE;
        }
    }
    ccinfo.pwsi = &pimpl_->wsi;

    if (!lws_client_connect_via_info(&ccinfo)) {
        pimpl_->state = WsConnectionState::Disconnected;
        pimpl_->finished = true;
        destroy_context();
        return false;
    }

    // Store impl pointer in wsi for callbacks
    lws_set_opaque_user_data(pimpl_->wsi, pimpl_.get());
    return true;
}

void WsClient::run() {
    while (!pimpl_->should_stop && !pimpl_->finished && pimpl_->context) {
        if (lws_service(pimpl_->context, 0) < 0) {
            break;
        }
    }

    pimpl_->state = WsConnectionState::Closing;
    destroy_context();
    pimpl_->state = WsConnectionState::Disconnected;
    pimpl_->notify_closed_once();
}

bool WsClient::send(const std::string& message) {
    if (pimpl_->state != WsConnectionState::Connected || !pimpl_->wsi) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(pimpl_->send_mutex);
        pimpl_->send_queue.push_back(message);
    }

    lws_callback_on_writable(pimpl_->wsi);
    return true;
}

void WsClient::close() {
    pimpl_->should_stop = true;
    std::lock_guard<std::mutex> lock(pimpl_->context_mutex);
    if (pimpl_->context) {
        lws_cancel_service(pimpl_->context);
    }
}

WsConnectionState WsClient::state() const noexcept {
    return pimpl_->state;
}

void WsClient::destroy_context() {
    std::lock_guard<std::mutex> lock(pimpl_->context_mutex);
    if (pimpl_->context) {
        lws_context_destroy(pimpl_->context);
        pimpl_->context = nullptr;
    }
    pimpl_->wsi = nullptr;
}

} // namespace delta
