#pragma once

#include "replicator/types.hpp"

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <optional>
#include <string>

namespace replicator {

// Tolerant field extraction. Nothing here throws on unexpected shapes: a
// field that is missing or has the wrong type is reported as absent.

// Integers, integral floats and decimal integer strings.
std::optional<long long> parse_integer(const nlohmann::json& value);

// Strings as-is, numbers rendered; null, empty strings, booleans and containers are absent.
std::optional<std::string> parse_text(const nlohmann::json& value);

std::optional<std::string> first_text(const nlohmann::json& obj, std::initializer_list<const char*> keys);
// The first key holding a non-zero, non-empty value decides; when every key is
// blank the last key's value is used as-is.
std::optional<long long> first_integer(const nlohmann::json& obj, std::initializer_list<const char*> keys);

Side parse_side(const nlohmann::json& obj);

AccountEvent trade_fill_from_json(const nlohmann::json& obj);
AccountEvent order_update_from_json(const nlohmann::json& obj);

} // namespace replicator
