#include "delta/order_client.hpp"

#include <iostream>
#include <utility>

namespace delta {
namespace {

constexpr double kBasisPoint = 0.0001;
constexpr std::size_t kClientOrderSuffixLength = 10;
constexpr const char* kBookDepthCancellation = "order_size_not_available_in_orderbook";

nlohmann::json parse_body(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return nlohmann::json(text);
    }
    return parsed;
}

// Response bodies may carry arbitrary bytes from proxies; never throw on them.
std::string printable(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json to_json(const RequestTimings& timings) {
    return {
        {"name_lookup_ms", timings.name_lookup_ms},
        {"connect_ms", timings.connect_ms},
        {"app_connect_ms", timings.app_connect_ms},
        {"start_transfer_ms", timings.start_transfer_ms},
        {"total_ms", timings.total_ms}
    };
}

nlohmann::json optional_json(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::string describe(const OrderRequest& order) {
    if (order.symbol) {
        return *order.symbol;
    }
    if (order.product_id) {
        return "product " + std::to_string(*order.product_id);
    }
    return "<unknown>";
}

} // namespace

OrderClient::OrderClient(Credentials credentials,
                         OrderSettings settings,
                         ClientOptions options,
                         std::unique_ptr<HttpTransport> transport)
    : ClientBase(std::move(credentials), std::move(options), std::move(transport)),
      settings_(std::move(settings)) {
    settings_.order_type = to_lower_copy(settings_.order_type);
    settings_.time_in_force = to_lower_copy(settings_.time_in_force);
}

std::string OrderClient::make_client_order_id() const {
    return settings_.client_order_prefix + random_hex(kClientOrderSuffixLength);
}

void OrderClient::set_audit_callback(OrderAuditCallback callback) {
    audit_callback_ = std::move(callback);
}

void OrderClient::audit(OrderAudit::Kind kind, const std::string& name, nlohmann::json context) const {
    if (audit_callback_) {
        audit_callback_(OrderAudit{kind, name, std::move(context)});
    }
}

std::optional<std::string> OrderClient::adjust_limit_price(const std::string& side,
                                                           const std::optional<std::string>& price,
                                                           double slippage_bps) {
    if (!price || price->empty()) {
        return std::nullopt;
    }
    auto value = parse_decimal(*price);
    if (!value) {
        return std::nullopt;
    }

    const double slip = slippage_bps * kBasisPoint;
    if (slip > 0.0) {
        *value = side == "buy" ? *value * (1.0 + slip) : *value * (1.0 - slip);
    }
    return format_decimal(*value, 8);
}

bool OrderClient::is_book_depth_cancellation(const nlohmann::json& body) {
    if (!body.is_object()) {
        return false;
    }
    const auto it = body.find("result");
    if (it == body.end() || !it->is_object()) {
        return false;
    }
    return it->value("state", std::string{}) == "cancelled" &&
           it->value("cancellation_reason", std::string{}) == kBookDepthCancellation;
}

nlohmann::json OrderClient::build_order_body(const OrderRequest& order) const {
    nlohmann::json body;
    body["side"] = to_lower_copy(order.side);
    body["order_type"] = settings_.order_type;
    body["time_in_force"] = settings_.time_in_force;
    body["size"] = order.size;
    body["reduce_only"] = false;
    body["client_order_id"] = make_client_order_id();
    if (order.product_id) {
        body["product_id"] = *order.product_id;
    }
    return body;
}

SubmitResult OrderClient::post_order(const nlohmann::json& body) const {
    const auto response = signed_request("POST", settings_.orders_path, body.dump());

    SubmitResult result;
    result.status_code = response.status_code;
    result.body = response.status_code == 0 ? nlohmann::json(response.body) : parse_body(response.body);
    result.request = body;
    result.timings = response.timings;

    audit(OrderAudit::Kind::Event, "order_submit",
          {{"status", result.status_code},
           {"resp", result.body},
           {"req", body},
           {"latency", to_json(result.timings)}});
    return result;
}

bool OrderClient::fallback_applies(const SubmitResult& result) const {
    return result.status_code == 200 &&
           settings_.order_type == "limit_order" &&
           settings_.time_in_force == "ioc" &&
           settings_.ioc_fallback_to_market &&
           !settings_.dry_run &&
           is_book_depth_cancellation(result.body);
}

SubmitResult OrderClient::place_topup(const OrderRequest& order) const {
    if (order.size <= 0) {
        return SubmitResult{200, {{"skipped", "non_positive_size"}}, nullptr, false};
    }

    if (settings_.dry_run) {
        nlohmann::json intended = {
            {"symbol", optional_json(order.symbol)},
            {"product_id", order.product_id ? nlohmann::json(*order.product_id) : nlohmann::json(nullptr)},
            {"side", order.side},
            {"size", order.size},
            {"price", optional_json(order.price)}
        };
        audit(OrderAudit::Kind::Event, "dry_run_order", std::move(intended));
        std::cout << "[Order] DRY_RUN place " << order.side << ' ' << order.size << " on "
                  << describe(order) << " (" << settings_.order_type << ", "
                  << order.price.value_or("-") << ")" << std::endl;
        return SubmitResult{200, {{"dry_run", true}}, nullptr, false};
    }

    auto body = build_order_body(order);

    if (settings_.order_type == "limit_order") {
        const auto limit = adjust_limit_price(body["side"].get<std::string>(), order.price,
                                              settings_.limit_slippage_bps);
        if (!limit) {
            std::cerr << "[Order] Missing limit price for " << order.side << ' ' << order.size
                      << " on " << describe(order) << std::endl;
            return SubmitResult{400, {{"error", "missing_limit_price"}}, body, false};
        }
        body["limit_price"] = *limit;
    }

    auto result = post_order(body);
    if (!result.ok()) {
        std::cerr << "[Order] ORDER ERROR status=" << result.status_code
                  << " resp=" << printable(result.body) << std::endl;
    } else {
        std::cout << "[Order] Placed top-up: " << order.side << ' ' << order.size << ' '
                  << describe(order) << " (" << settings_.order_type << " @ "
                  << body.value("limit_price", std::string{"market"}) << ")" << std::endl;
    }

    if (!fallback_applies(result)) {
        return result;
    }

    audit(OrderAudit::Kind::Action, "limit_ioc_cancel_fallback",
          {{"symbol", optional_json(order.symbol)},
           {"side", body["side"]},
           {"size", order.size},
           {"limit_price", body.value("limit_price", std::string{})},
           {"client_order_id", body["client_order_id"]}});

    std::cout << "[Order] IOC top-up cancelled for depth, resubmitting as market: "
              << order.side << ' ' << order.size << ' ' << describe(order) << std::endl;

    auto market_body = body;
    market_body["order_type"] = "market_order";
    market_body["client_order_id"] = make_client_order_id();
    market_body.erase("limit_price");

    auto fallback = post_order(market_body);
    fallback.fell_back_to_market = true;
    if (fallback.ok()) {
        std::cout << "[Order] Placed market order: " << order.side << ' ' << order.size << ' '
                  << describe(order) << std::endl;
    } else {
        std::cerr << "[Order] Market fallback failed status=" << fallback.status_code
                  << " resp=" << printable(fallback.body) << std::endl;
    }
    return fallback;
}

} // namespace delta
