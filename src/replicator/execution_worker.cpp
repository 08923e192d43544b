#include "replicator/execution_worker.hpp"

#include <algorithm>
#include <iostream>
#include <random>
#include <stdexcept>

namespace replicator {

ExecutionWorker::ExecutionWorker(OrderQueue& queue,
                                 const delta::OrderClient& orders,
                                 CapLedger& ledger,
                                 EventLog& log,
                                 ShutdownCoordinator& shutdown,
                                 WorkerSettings settings)
    : queue_(queue),
      orders_(orders),
      ledger_(ledger),
      log_(log),
      shutdown_(shutdown),
      settings_(settings),
      finished_future_(finished_.get_future()) {}

ExecutionWorker::~ExecutionWorker() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ExecutionWorker::start() {
    if (thread_.joinable()) {
        throw std::logic_error("ExecutionWorker already started");
    }
    running_ = true;
    thread_ = std::thread([this] {
        run();
        running_ = false;
        finished_.set_value();
    });
}

bool ExecutionWorker::join_for(std::chrono::duration<double> timeout) {
    if (!thread_.joinable()) {
        return true;
    }
    if (finished_future_.wait_for(timeout) == std::future_status::ready) {
        thread_.join();
        return true;
    }
    std::cerr << "[Worker] Did not stop within " << timeout.count() << "s, detaching" << std::endl;
    thread_.detach();
    return false;
}

void ExecutionWorker::run() {
    std::cout << "[Worker] Order worker started" << std::endl;
    while (true) {
        auto item = queue_.pop();
        if (!item) {
            break;
        }
        try {
            process(*item);
        } catch (const std::exception& ex) {
            std::cerr << "[Worker] Top-up " << item->audit_id << " failed: " << ex.what() << std::endl;
            auto context = to_json(*item);
            context["error"] = ex.what();
            log_.event("worker_error", context);
            pause_after_failure();
        }
        ++processed_;
    }
    std::cout << "[Worker] Order worker stopped" << std::endl;
}

void ExecutionWorker::process(const TopUpJob& job) {
    auto context = to_json(job);
    log_.action("dequeue_topup", context);

    if (job.size <= 0 || job.side == Side::Unknown) {
        log_.skip("invalid_job", context);
        return;
    }
    if (!ledger_.admits(job.symbol, job.size)) {
        auto cap_context = context;
        cap_context["add"] = job.size;
        log_.skip("symbol_cap_exceeded_worker", cap_context);
        return;
    }

    delta::OrderRequest request;
    request.symbol = job.symbol;
    request.product_id = job.product_id;
    request.side = to_string(job.side);
    request.size = job.size;
    request.price = job.price;

    const auto result = orders_.place_topup(request);

    auto outcome = context;
    outcome["status"] = result.status_code;
    outcome["resp"] = result.body;
    outcome["fell_back_to_market"] = result.fell_back_to_market;
    outcome["latency_ms"] = result.timings.total_ms;
    log_.action("order_result", outcome);

    if (result.ok()) {
        ledger_.record(job.symbol, job.size);
        return;
    }
    pause_after_failure();
}

void ExecutionWorker::pause_after_failure() {
    const double lo = settings_.failure_pause_min.count();
    const double hi = std::max(lo, settings_.failure_pause_max.count());
    if (hi <= 0.0) {
        return;
    }
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(lo, hi);
    shutdown_.wait_for(std::chrono::duration<double>(dist(rng)));
}

} // namespace replicator
