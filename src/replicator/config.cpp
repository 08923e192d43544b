#include "replicator/config.hpp"

#include "delta/util.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace replicator {
namespace {

constexpr long long kMaxIdTtlSeconds = 10LL * 365 * 86400;
// Keep-alive timers are 16-bit second counters in libwebsockets.
constexpr int kMaxPingSeconds = 3600;

struct FlagOption {
    const char* flag;
    const char* env;
    bool boolean;
};

const FlagOption kFlags[] = {
    {"--ws-url", "DELTA_WS_URL", false},
    {"--api-base", "DELTA_API_BASE", false},
    {"--api-key", "DELTA_API_KEY", false},
    {"--api-secret", "DELTA_API_SECRET", false},
    {"--ws-insecure", "WS_INSECURE", true},
    {"--multiplier", "USER_MULTIPLIER", false},
    {"--dry-run", "DRY_RUN", true},
    {"--allow-symbols", "ALLOW_SYMBOLS", false},
    {"--order-type", "ORDER_TYPE", false},
    {"--tif", "TIME_IN_FORCE", false},
    {"--limit-slippage-bps", "LIMIT_SLIPPAGE_BPS", false},
    {"--limit-ioc-fallback-market", "LIMIT_IOC_FALLBACK_MARKET", true},
    {"--max-topup-per-trade", "MAX_TOPUP_PER_TRADE", false},
    {"--max-topup-per-symbol", "MAX_TOPUP_PER_SYMBOL", false},
    {"--self-tag-prefix", "SELF_TAG_PREFIX", false},
    {"--verbose-decisions", "VERBOSE_DECISIONS", true},
    {"--user-agent", "USER_AGENT", false},
    {"--ping-interval", "PING_INTERVAL", false},
    {"--ping-timeout", "PING_TIMEOUT", false},
    {"--enable-heartbeat", "ENABLE_HEARTBEAT", true},
    {"--trades-channel", "TRADES_CHANNEL", false},
    {"--log-dir", "LOG_DIR", false},
    {"--http-timeout", "HTTP_TIMEOUT", false},
    {"--http-conn-timeout", "HTTP_CONN_TIMEOUT", false},
    {"--http-retries", "HTTP_RETRIES", false},
    {"--backoff-base", "BACKOFF_BASE", false},
    {"--backoff-max", "BACKOFF_MAX", false},
    {"--backoff-jitter", "BACKOFF_JITTER", false},
};

const FlagOption* find_flag(const std::string& name) {
    for (const auto& option : kFlags) {
        if (name == option.flag) {
            return &option;
        }
    }
    return nullptr;
}

std::optional<std::string> env_value(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    auto value = delta::trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string env_string(const char* name, const std::string& fallback) {
    return env_value(name).value_or(fallback);
}

bool env_bool(const char* name, bool fallback) {
    const auto value = env_value(name);
    return value ? parse_bool(*value) : fallback;
}

long long env_integer(const char* name, long long fallback) {
    const auto value = env_value(name);
    return value ? parse_integer_setting(name, *value) : fallback;
}

double env_double(const char* name, double fallback) {
    const auto value = env_value(name);
    return value ? parse_double_setting(name, *value) : fallback;
}

int env_int(const char* name, int fallback) {
    const auto value = env_integer(name, fallback);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigError(std::string(name) + " is out of range");
    }
    return static_cast<int>(value);
}

long to_millis(double seconds) {
    return static_cast<long>(std::llround(seconds * 1000.0));
}

} // namespace

bool parse_bool(const std::string& value) {
    const auto lowered = delta::to_lower_copy(delta::trim(value));
    return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on";
}

long long parse_integer_setting(const std::string& name, const std::string& value) {
    std::string digits;
    for (const char ch : delta::trim(value)) {
        if (ch != '_') {
            digits.push_back(ch);
        }
    }
    if (digits.empty()) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    }
    try {
        std::size_t consumed = 0;
        const long long parsed = std::stoll(digits, &consumed, 10);
        if (consumed != digits.size()) {
            throw ConfigError(name + " must be an integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ConfigError(name + " must be an integer, got '" + value + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError(name + " is out of range: '" + value + "'");
    }
}

double parse_double_setting(const std::string& name, const std::string& value) {
    const auto parsed = delta::parse_decimal(delta::trim(value));
    if (!parsed) {
        throw ConfigError(name + " must be a number, got '" + value + "'");
    }
    return *parsed;
}

bool load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        line = delta::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (delta::starts_with(line, "export ")) {
            line = delta::trim(line.substr(7));
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = delta::trim(line.substr(0, pos));
        auto value = delta::trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
        }
    }
    return true;
}

CommandLine parse_command_line(int argc, const char* const* argv) {
    CommandLine result;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            result.show_help = true;
            continue;
        }

        std::optional<std::string> inline_value;
        const auto eq = arg.find('=');
        if (delta::starts_with(arg, "--") && eq != std::string::npos) {
            inline_value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }

        auto take_value = [&]() -> std::string {
            if (inline_value) {
                return *inline_value;
            }
            if (i + 1 >= argc) {
                throw ConfigError("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--env-file") {
            result.env_file = take_value();
            continue;
        }

        const auto* option = find_flag(arg);
        if (option == nullptr) {
            throw ConfigError("unknown option: " + arg);
        }
        if (option->boolean && !inline_value) {
            result.overrides[option->env] = "true";
            continue;
        }
        result.overrides[option->env] = take_value();
    }
    return result;
}

void apply_cli_overrides(const CommandLine& command_line) {
    for (const auto& [name, value] : command_line.overrides) {
        setenv(name.c_str(), value.c_str(), 1);
    }
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n\n"
        << "Mirrors account fills with multiplier top-up orders on Delta Exchange.\n"
        << "Every option falls back to the environment variable shown, then to .env.\n\n"
        << "  -h, --help                 show this message\n"
        << "  --env-file PATH            dotenv file to load (default .env)\n";
    for (const auto& option : kFlags) {
        std::string left = std::string("  ") + option.flag + (option.boolean ? "[=BOOL]" : " VALUE");
        if (left.size() < 29) {
            left.append(29 - left.size(), ' ');
        } else {
            left.push_back(' ');
        }
        out << left << option.env << '\n';
    }
    return out.str();
}

BotConfig load_config() {
    BotConfig config;
    config.ws_url = env_string("DELTA_WS_URL", config.ws_url);
    config.api_base = env_string("DELTA_API_BASE", config.api_base);
    config.api_key = env_string("DELTA_API_KEY", "");
    config.api_secret = env_string("DELTA_API_SECRET", "");
    config.ws_insecure = env_bool("WS_INSECURE", config.ws_insecure);

    config.multiplier = env_double("USER_MULTIPLIER", config.multiplier);
    config.dry_run = env_bool("DRY_RUN", config.dry_run);
    if (const auto symbols = env_value("ALLOW_SYMBOLS")) {
        config.allow_symbols.clear();
        for (const auto& symbol : delta::split_list(*symbols, ',')) {
            config.allow_symbols.push_back(delta::to_upper_copy(symbol));
        }
    }

    config.order_type = delta::to_lower_copy(env_string("ORDER_TYPE", config.order_type));
    config.time_in_force = delta::to_lower_copy(env_string("TIME_IN_FORCE", config.time_in_force));
    config.limit_slippage_bps = env_double("LIMIT_SLIPPAGE_BPS", config.limit_slippage_bps);
    config.limit_ioc_fallback_market = env_bool("LIMIT_IOC_FALLBACK_MARKET", config.limit_ioc_fallback_market);

    config.max_topup_per_trade = env_integer("MAX_TOPUP_PER_TRADE", config.max_topup_per_trade);
    config.max_topup_per_symbol = env_integer("MAX_TOPUP_PER_SYMBOL", config.max_topup_per_symbol);
    config.self_tag_prefix = env_string("SELF_TAG_PREFIX", config.self_tag_prefix);
    config.verbose_decisions = env_bool("VERBOSE_DECISIONS", config.verbose_decisions);
    config.user_agent = env_string("USER_AGENT", config.user_agent);

    config.ping_interval_s = env_int("PING_INTERVAL", config.ping_interval_s);
    config.ping_timeout_s = env_int("PING_TIMEOUT", config.ping_timeout_s);
    config.enable_heartbeat = env_bool("ENABLE_HEARTBEAT", config.enable_heartbeat);
    config.trades_channel = env_string("TRADES_CHANNEL", config.trades_channel);
    if (const char* raw = std::getenv("LOG_DIR")) {
        config.log_dir = delta::trim(raw);
    }

    config.http_timeout_s = env_double("HTTP_TIMEOUT", config.http_timeout_s);
    config.http_conn_timeout_s = env_double("HTTP_CONN_TIMEOUT", config.http_conn_timeout_s);
    config.http_retries = env_int("HTTP_RETRIES", config.http_retries);

    config.backoff_base_s = env_double("BACKOFF_BASE", config.backoff_base_s);
    config.backoff_max_s = env_double("BACKOFF_MAX", config.backoff_max_s);
    config.backoff_jitter = env_double("BACKOFF_JITTER", config.backoff_jitter);

    config.fill_id_ttl_s = env_integer("FILL_ID_TTL_SEC", config.fill_id_ttl_s);
    config.fill_id_max = env_integer("FILL_ID_MAX", config.fill_id_max);
    config.trade_id_ttl_s = env_integer("TRADE_ID_TTL_SEC", config.trade_id_ttl_s);
    config.trade_id_max = env_integer("TRADE_ID_MAX", config.trade_id_max);
    config.order_queue_capacity = env_integer("ORDER_QUEUE_CAPACITY", config.order_queue_capacity);
    config.shutdown_timeout_s = env_double("SHUTDOWN_TIMEOUT", config.shutdown_timeout_s);
    return config;
}

void BotConfig::validate() const {
    if (api_key.empty() || api_secret.empty()) {
        throw ConfigError("DELTA_API_KEY and DELTA_API_SECRET must be set");
    }
    if (ws_url.empty() || api_base.empty()) {
        throw ConfigError("DELTA_WS_URL and DELTA_API_BASE must not be empty");
    }
    if (!std::isfinite(multiplier) || multiplier < 0.0) {
        throw ConfigError("USER_MULTIPLIER must be a finite, non-negative number");
    }
    if (order_type != "market_order" && order_type != "limit_order") {
        throw ConfigError("ORDER_TYPE must be market_order or limit_order, got '" + order_type + "'");
    }
    if (time_in_force != "ioc" && time_in_force != "gtc" && time_in_force != "fok") {
        throw ConfigError("TIME_IN_FORCE must be IOC, GTC or FOK, got '" + time_in_force + "'");
    }
    if (!std::isfinite(limit_slippage_bps) || limit_slippage_bps < 0.0) {
        throw ConfigError("LIMIT_SLIPPAGE_BPS must be non-negative");
    }
    if (self_tag_prefix.empty()) {
        throw ConfigError("SELF_TAG_PREFIX must not be empty");
    }
    if (allow_symbols.empty()) {
        throw ConfigError("ALLOW_SYMBOLS must name at least one symbol or ALL");
    }
    if (max_topup_per_trade <= 0 || max_topup_per_symbol <= 0) {
        throw ConfigError("MAX_TOPUP_PER_TRADE and MAX_TOPUP_PER_SYMBOL must be positive");
    }
    if (fill_id_ttl_s <= 0 || trade_id_ttl_s <= 0) {
        throw ConfigError("FILL_ID_TTL_SEC and TRADE_ID_TTL_SEC must be positive");
    }
    if (fill_id_ttl_s > kMaxIdTtlSeconds || trade_id_ttl_s > kMaxIdTtlSeconds) {
        throw ConfigError("FILL_ID_TTL_SEC and TRADE_ID_TTL_SEC must not exceed " +
                          std::to_string(kMaxIdTtlSeconds));
    }
    if (fill_id_max <= 0 || trade_id_max <= 0 || order_queue_capacity <= 0) {
        throw ConfigError("FILL_ID_MAX, TRADE_ID_MAX and ORDER_QUEUE_CAPACITY must be positive");
    }
    if (ping_interval_s <= 0 || ping_timeout_s <= 0) {
        throw ConfigError("PING_INTERVAL and PING_TIMEOUT must be positive");
    }
    if (ping_interval_s > kMaxPingSeconds || ping_timeout_s > kMaxPingSeconds) {
        throw ConfigError("PING_INTERVAL and PING_TIMEOUT must not exceed " + std::to_string(kMaxPingSeconds));
    }
    if (http_timeout_s <= 0.0 || http_conn_timeout_s <= 0.0) {
        throw ConfigError("HTTP_TIMEOUT and HTTP_CONN_TIMEOUT must be positive");
    }
    if (http_retries < 1) {
        throw ConfigError("HTTP_RETRIES must be at least 1");
    }
    if (backoff_base_s <= 0.0 || backoff_max_s < backoff_base_s) {
        throw ConfigError("BACKOFF_BASE must be positive and not above BACKOFF_MAX");
    }
    if (!(backoff_jitter >= 0.0 && backoff_jitter <= 1.0)) {
        throw ConfigError("BACKOFF_JITTER must be within [0, 1]");
    }
    if (!(shutdown_timeout_s >= 0.0)) {
        throw ConfigError("SHUTDOWN_TIMEOUT must be non-negative");
    }
}

delta::Credentials BotConfig::credentials() const {
    return delta::Credentials{api_key, api_secret};
}

delta::ClientOptions BotConfig::client_options() const {
    delta::ClientOptions options;
    options.base_url = api_base;
    options.user_agent = user_agent;
    options.http.connect_timeout_ms = to_millis(http_conn_timeout_s);
    options.http.read_timeout_ms = to_millis(http_timeout_s);
    options.retry.max_attempts = http_retries;
    return options;
}

delta::OrderSettings BotConfig::order_settings() const {
    delta::OrderSettings settings;
    settings.order_type = order_type;
    settings.time_in_force = time_in_force;
    settings.client_order_prefix = self_tag_prefix;
    settings.limit_slippage_bps = limit_slippage_bps;
    settings.ioc_fallback_to_market = limit_ioc_fallback_market;
    settings.dry_run = dry_run;
    return settings;
}

delta::WsClientOptions BotConfig::ws_options() const {
    delta::WsClientOptions options;
    options.url = ws_url;
    options.insecure = ws_insecure;
    options.ping_interval_s = ping_interval_s;
    options.ping_timeout_s = ping_timeout_s;
    return options;
}

DedupSettings BotConfig::dedup_settings() const {
    DedupSettings settings;
    settings.fill_capacity = static_cast<std::size_t>(fill_id_max);
    settings.fill_ttl = std::chrono::seconds(fill_id_ttl_s);
    settings.trade_capacity = static_cast<std::size_t>(trade_id_max);
    settings.trade_ttl = std::chrono::seconds(trade_id_ttl_s);
    return settings;
}

CapLimits BotConfig::cap_limits() const {
    return CapLimits{max_topup_per_trade, max_topup_per_symbol};
}

DecisionSettings BotConfig::decision_settings() const {
    DecisionSettings settings;
    settings.multiplier = multiplier;
    settings.allow_symbols = allow_symbols;
    settings.self_tag_prefix = self_tag_prefix;
    return settings;
}

ConnectionSettings BotConfig::connection_settings() const {
    ConnectionSettings settings;
    settings.url = ws_url;
    settings.credentials = credentials();
    settings.trades_channel = trades_channel;
    settings.enable_heartbeat = enable_heartbeat;
    settings.backoff = BackoffSettings{backoff_base_s, backoff_max_s, backoff_jitter};
    return settings;
}

EventLogConfig BotConfig::event_log_config() const {
    EventLogConfig config;
    config.directory = log_dir;
    config.verbose_decisions = verbose_decisions;
    return config;
}

} // namespace replicator
