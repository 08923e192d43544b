#include "replicator/event_log.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace replicator {
namespace {

std::tm local_time(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

nlohmann::json as_context(nlohmann::json context) {
    if (context.is_object()) {
        return context;
    }
    return nlohmann::json{{"value", std::move(context)}};
}

} // namespace

EventLog::EventLog(EventLogConfig config)
    : config_(std::move(config)) {}

std::string EventLog::now_iso8601() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    const auto tm = local_time(system_clock::to_time_t(now));

    char offset[8] = {};
    std::strftime(offset, sizeof(offset), "%z", &tm);
    std::string zone = offset;
    if (zone.size() == 5) {
        zone.insert(3, ":");
    }

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms << zone;
    return oss.str();
}

void EventLog::skip(const std::string& reason, nlohmann::json context) {
    if (!config_.verbose_decisions) {
        return;
    }
    write({{"kind", "skip"}, {"reason", reason}, {"context", as_context(std::move(context))}});
}

void EventLog::action(const std::string& action, nlohmann::json context) {
    write({{"kind", "action"}, {"action", action}, {"context", as_context(std::move(context))}});
}

void EventLog::event(const std::string& type, nlohmann::json context) {
    write({{"kind", "event"}, {"type", type}, {"context", as_context(std::move(context))}});
}

void EventLog::set_observer(EventObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

std::filesystem::path EventLog::current_path() const {
    return path_for_today();
}

std::filesystem::path EventLog::path_for_today() const {
    if (config_.directory.empty()) {
        return {};
    }
    const auto tm = local_time(std::time(nullptr));
    std::ostringstream name;
    name << config_.file_prefix << std::put_time(&tm, "%Y-%m-%d") << ".jsonl";
    return config_.directory / name.str();
}

void EventLog::ensure_directory() const {
    if (!config_.directory.empty() && !std::filesystem::exists(config_.directory)) {
        std::filesystem::create_directories(config_.directory);
    }
}

void EventLog::write(nlohmann::json record) {
    record["ts"] = now_iso8601();

    std::lock_guard<std::mutex> lock(mutex_);
    if (observer_) {
        observer_(record);
    }

    if (config_.directory.empty()) {
        return;
    }

    const auto line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    try {
        ensure_directory();
        std::ofstream output(path_for_today(), std::ios::app);
        if (!output.good()) {
            throw std::runtime_error("cannot open " + path_for_today().string());
        }
        output << line << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "[Log] Write error: " << ex.what() << " | entry=" << line << std::endl;
    }
}

} // namespace replicator
