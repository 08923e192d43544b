#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>

namespace replicator {

struct EventLogConfig {
    std::filesystem::path directory = "logs";   // empty disables the JSONL file
    std::string file_prefix = "topup_events_";
    bool verbose_decisions = true;              // write "skip" records
};

using EventObserver = std::function<void(const nlohmann::json& record)>;

// Structured decision/audit records, one JSON object per line:
//   {"ts": ..., "kind": "skip"|"action"|"event", "reason"|"action"|"type": ..., "context": {...}}
// Safe to call from both the ingestion and the execution thread.
class EventLog {
public:
    explicit EventLog(EventLogConfig config = {});

    void skip(const std::string& reason, nlohmann::json context = nlohmann::json::object());
    void action(const std::string& action, nlohmann::json context = nlohmann::json::object());
    void event(const std::string& type, nlohmann::json context = nlohmann::json::object());

    void set_observer(EventObserver observer);

    std::filesystem::path current_path() const;

    static std::string now_iso8601();

private:
    void write(nlohmann::json record);
    void ensure_directory() const;
    std::filesystem::path path_for_today() const;

    EventLogConfig config_;
    EventObserver observer_;
    mutable std::mutex mutex_;
};

} // namespace replicator
