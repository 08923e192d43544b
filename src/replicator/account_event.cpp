#include "replicator/account_event.hpp"

#include "delta/util.hpp"

#include <cmath>
#include <limits>

namespace replicator {
namespace {

constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53

const nlohmann::json* find_field(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) {
        return nullptr;
    }
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

// Zero, false and empty values defer to the next key in a lookup chain.
bool is_blank(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get_ref<const std::string&>().empty();
    }
    if (value.is_object() || value.is_array()) {
        return value.empty();
    }
    if (value.is_boolean()) {
        return !value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() == 0.0;
    }
    return false;
}

} // namespace

std::optional<long long> parse_integer(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        if (value.is_number_unsigned() &&
            value.get<unsigned long long>() >
                static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
            return std::nullopt;
        }
        return value.get<long long>();
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (!std::isfinite(d) || std::floor(d) != d || std::fabs(d) > kMaxExactInteger) {
            return std::nullopt;
        }
        return static_cast<long long>(d);
    }
    if (value.is_string()) {
        const auto text = delta::trim(value.get<std::string>());
        if (text.empty()) {
            return std::nullopt;
        }
        try {
            std::size_t consumed = 0;
            const long long parsed = std::stoll(text, &consumed, 10);
            if (consumed != text.size()) {
                return std::nullopt;
            }
            return parsed;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<std::string> parse_text(const nlohmann::json& value) {
    if (value.is_string()) {
        auto text = value.get<std::string>();
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
    if (value.is_number_integer()) {
        return value.is_number_unsigned() ? std::to_string(value.get<unsigned long long>())
                                          : std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) {
        return value.dump();
    }
    return std::nullopt;
}

std::optional<std::string> first_text(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (const auto* field = find_field(obj, key)) {
            if (auto text = parse_text(*field)) {
                return text;
            }
        }
    }
    return std::nullopt;
}

std::optional<long long> first_integer(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    const nlohmann::json* last = nullptr;
    for (const char* key : keys) {
        last = find_field(obj, key);
        if (last && !is_blank(*last)) {
            return parse_integer(*last);
        }
    }
    return last ? parse_integer(*last) : std::nullopt;
}

Side parse_side(const nlohmann::json& obj) {
    const auto raw = first_text(obj, {"side", "order_side"});
    if (!raw) {
        return Side::Unknown;
    }
    const auto side = delta::to_lower_copy(*raw);
    if (delta::starts_with(side, "b")) {
        return Side::Buy;
    }
    if (delta::starts_with(side, "s")) {
        return Side::Sell;
    }
    return Side::Unknown;
}

namespace {

void fill_common(const nlohmann::json& obj, AccountEvent& event) {
    if (auto symbol = first_text(obj, {"symbol", "product_symbol", "product_symbol_name"})) {
        event.symbol = delta::to_upper_copy(*symbol);
    }
    for (const char* key : {"product_id", "instrument_id"}) {
        if (const auto* field = find_field(obj, key)) {
            if (auto id = parse_integer(*field)) {
                event.product_id = id;
                break;
            }
        }
    }
    event.side = parse_side(obj);
    event.fill_id = first_text(obj, {"fill_id"});
    event.client_order_id = first_text(obj, {"client_order_id", "client_id", "text"}).value_or("");
    event.text = first_text(obj, {"text"}).value_or("");
}

} // namespace

AccountEvent trade_fill_from_json(const nlohmann::json& obj) {
    AccountEvent event;
    event.kind = EventKind::TradeFill;
    fill_common(obj, event);
    event.trade_id = first_text(obj, {"id", "trade_id"});
    event.quantity = first_integer(obj, {"size", "fill_size", "quantity", "filled_quantity"});
    event.price = first_text(obj, {"price"});
    return event;
}

AccountEvent order_update_from_json(const nlohmann::json& obj) {
    AccountEvent event;
    event.kind = EventKind::OrderUpdate;
    fill_common(obj, event);
    event.order_id = first_text(obj, {"id", "order_id"});
    event.quantity = first_integer(obj, {"filled_size", "total_filled", "cumulative_qty"});
    event.price = first_text(obj, {"average_fill_price", "price"});
    event.state = delta::to_lower_copy(first_text(obj, {"state"}).value_or(""));
    event.unfilled_size = first_integer(obj, {"unfilled_size"});
    return event;
}

} // namespace replicator
