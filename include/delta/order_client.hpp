#pragma once

#include "delta/client_base.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace delta {

struct OrderSettings {
    std::string orders_path = "/v2/orders";
    std::string order_type = "market_order";   // market_order | limit_order
    std::string time_in_force = "ioc";          // ioc | gtc | fok
    std::string client_order_prefix = "BOTMULT_";
    double limit_slippage_bps = 0.0;
    bool ioc_fallback_to_market = true;
    bool dry_run = false;
};

struct OrderRequest {
    std::optional<std::string> symbol;
    std::optional<long long> product_id;
    std::string side;                 // buy | sell
    long long size = 0;
    std::optional<std::string> price; // advisory, limit orders only
};

struct SubmitResult {
    long status_code = 0;
    nlohmann::json body;              // parsed JSON, or the raw text as a string
    nlohmann::json request;           // the body that produced this result, if any was sent
    bool fell_back_to_market = false;
    RequestTimings timings;           // of the last HTTP attempt

    [[nodiscard]] bool ok() const noexcept { return status_code >= 200 && status_code < 300; }
};

// Audit records for every submission, dry-run and market fallback.
struct OrderAudit {
    enum class Kind { Event, Action };

    Kind kind = Kind::Event;
    std::string name;                 // order_submit | dry_run_order | limit_ioc_cancel_fallback
    nlohmann::json context;
};

using OrderAuditCallback = std::function<void(const OrderAudit&)>;

class OrderClient : public ClientBase {
public:
    OrderClient(Credentials credentials,
                OrderSettings settings,
                ClientOptions options = {},
                std::unique_ptr<HttpTransport> transport = nullptr);

    SubmitResult place_topup(const OrderRequest& order) const;

    const OrderSettings& settings() const noexcept { return settings_; }

    std::string make_client_order_id() const;

    void set_audit_callback(OrderAuditCallback callback);

    // Raises the price for buys and lowers it for sells by `slippage_bps`.
    static std::optional<std::string> adjust_limit_price(const std::string& side,
                                                         const std::optional<std::string>& price,
                                                         double slippage_bps);

    static bool is_book_depth_cancellation(const nlohmann::json& body);

private:
    nlohmann::json build_order_body(const OrderRequest& order) const;
    SubmitResult post_order(const nlohmann::json& body) const;
    bool fallback_applies(const SubmitResult& result) const;
    void audit(OrderAudit::Kind kind, const std::string& name, nlohmann::json context) const;

    OrderSettings settings_;
    OrderAuditCallback audit_callback_;
};

} // namespace delta
