#include "replicator/shutdown.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace replicator {

bool ShutdownCoordinator::request(const std::string& reason) {
    std::vector<StopHook> hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_.load(std::memory_order_acquire)) {
            return false;
        }
        reason_ = reason;
        stopped_.store(true, std::memory_order_release);
        hooks = hooks_;
    }
    wake_.notify_all();

    std::cout << "[Shutdown] Stop requested (" << reason << ")" << std::endl;
    for (const auto& hook : hooks) {
        run_hook(hook);
    }
    return true;
}

std::string ShutdownCoordinator::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

void ShutdownCoordinator::add_stop_hook(StopHook hook) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopped_.load(std::memory_order_acquire)) {
            hooks_.push_back(std::move(hook));
            return;
        }
    }
    run_hook(hook);
}

bool ShutdownCoordinator::wait_for(std::chrono::duration<double> duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration);
    return wake_.wait_for(lock, timeout, [this] { return stopped_.load(std::memory_order_acquire); });
}

void ShutdownCoordinator::run_hook(const StopHook& hook) {
    if (!hook) {
        return;
    }
    try {
        hook();
    } catch (const std::exception& ex) {
        std::cerr << "[Shutdown] Stop hook failed: " << ex.what() << std::endl;
    }
}

} // namespace replicator
