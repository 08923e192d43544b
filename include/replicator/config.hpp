#pragma once

#include "delta/client_base.hpp"
#include "delta/order_client.hpp"
#include "delta/ws_client.hpp"
#include "replicator/cap_ledger.hpp"
#include "replicator/connection_manager.hpp"
#include "replicator/decision_engine.hpp"
#include "replicator/dedup_store.hpp"
#include "replicator/event_log.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace replicator {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct BotConfig {
    std::string ws_url = "wss://socket.india.delta.exchange";
    std::string api_base = "https://api.india.delta.exchange";
    std::string api_key;
    std::string api_secret;
    bool ws_insecure = false;

    double multiplier = 2.0;
    bool dry_run = false;
    std::vector<std::string> allow_symbols{"ALL"};

    std::string order_type = "market_order";
    std::string time_in_force = "ioc";
    double limit_slippage_bps = 0.0;
    bool limit_ioc_fallback_market = true;

    long long max_topup_per_trade = 1000000;
    long long max_topup_per_symbol = 10000000;
    std::string self_tag_prefix = "BOTMULT_";
    bool verbose_decisions = true;
    std::string user_agent = "delta-topup-replicator";

    int ping_interval_s = 30;
    int ping_timeout_s = 5;
    bool enable_heartbeat = true;
    std::string trades_channel = "user_trades";
    std::string log_dir = "logs";

    double http_timeout_s = 10.0;
    double http_conn_timeout_s = 3.05;
    int http_retries = 3;

    double backoff_base_s = 1.0;
    double backoff_max_s = 60.0;
    double backoff_jitter = 0.4;

    long long fill_id_ttl_s = 86400;
    long long fill_id_max = 200000;
    long long trade_id_ttl_s = 86400;
    long long trade_id_max = 200000;
    long long order_queue_capacity = 1000;
    double shutdown_timeout_s = 5.0;

    // Throws ConfigError describing the first problem found.
    void validate() const;

    delta::Credentials credentials() const;
    delta::ClientOptions client_options() const;
    delta::OrderSettings order_settings() const;
    delta::WsClientOptions ws_options() const;
    DedupSettings dedup_settings() const;
    CapLimits cap_limits() const;
    DecisionSettings decision_settings() const;
    ConnectionSettings connection_settings() const;
    EventLogConfig event_log_config() const;
};

struct CommandLine {
    bool show_help = false;
    std::string env_file = ".env";
    std::map<std::string, std::string> overrides;   // env var -> value
};

// Lines of KEY=VALUE; '#' comments and blank lines are ignored, surrounding
// double quotes are stripped. Overrides variables already set. Returns false
// when the file cannot be opened.
bool load_env_file(const std::string& path);

// Throws ConfigError on unknown flags or missing values.
CommandLine parse_command_line(int argc, const char* const* argv);

void apply_cli_overrides(const CommandLine& command_line);

BotConfig load_config();

std::string usage(const std::string& program);

// Helpers shared with tests.
bool parse_bool(const std::string& value);
long long parse_integer_setting(const std::string& name, const std::string& value);
double parse_double_setting(const std::string& name, const std::string& value);

} // namespace replicator
