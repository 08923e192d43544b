#pragma once

#include "delta/order_client.hpp"
#include "replicator/cap_ledger.hpp"
#include "replicator/event_log.hpp"
#include "replicator/order_queue.hpp"
#include "replicator/shutdown.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace replicator {

struct WorkerSettings {
    // Pause after a failed submission, drawn uniformly from [min, max].
    std::chrono::duration<double> failure_pause_min{1.25};
    std::chrono::duration<double> failure_pause_max{5.0};
};

// Consumer side of the order queue. Each job is submitted at most once.
class ExecutionWorker {
public:
    ExecutionWorker(OrderQueue& queue,
                    const delta::OrderClient& orders,
                    CapLedger& ledger,
                    EventLog& log,
                    ShutdownCoordinator& shutdown,
                    WorkerSettings settings = {});
    ~ExecutionWorker();

    ExecutionWorker(const ExecutionWorker&) = delete;
    ExecutionWorker& operator=(const ExecutionWorker&) = delete;

    void start();

    // Blocks until the sentinel is consumed. A job whose submission throws is
    // logged as a worker_error and counted as a failure.
    void run();

    // Processes one job; exposed for tests.
    void process(const TopUpJob& job);

    // Waits up to `timeout` for run() to return. Joins on success, detaches
    // otherwise. True when the thread finished in time.
    bool join_for(std::chrono::duration<double> timeout);

    bool running() const noexcept { return running_.load(); }
    std::size_t processed() const noexcept { return processed_.load(); }

private:
    void pause_after_failure();

    OrderQueue& queue_;
    const delta::OrderClient& orders_;
    CapLedger& ledger_;
    EventLog& log_;
    ShutdownCoordinator& shutdown_;
    WorkerSettings settings_;

    std::thread thread_;
    std::promise<void> finished_;
    std::future<void> finished_future_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> processed_{0};
};

} // namespace replicator
