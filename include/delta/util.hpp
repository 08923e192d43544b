#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace delta {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

std::string hmac_sha256_hex(const std::string& key, const std::string& message);

std::string to_upper_copy(std::string value);
std::string to_lower_copy(std::string value);

std::string trim(std::string value);

// Splits on `delimiter`, trims each piece and drops empty ones.
std::vector<std::string> split_list(const std::string& value, char delimiter = ',');

bool starts_with(const std::string& value, const std::string& prefix);

// Fixed-point rendering with trailing zeros (and a dangling '.') removed.
std::string format_decimal(double value, int precision = 8);

std::optional<double> parse_decimal(const std::string& value);

std::string random_hex(std::size_t length);

long long unix_timestamp_seconds();

} // namespace delta
