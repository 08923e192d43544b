#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace replicator {

using StopHook = std::function<void()>;

// One-shot stop signal shared by the ingestion and execution threads.
class ShutdownCoordinator {
public:
    // Only the first call has an effect (returns true). It sets the flag, wakes
    // every wait_for() and runs the hooks in registration order.
    bool request(const std::string& reason);

    bool stop_requested() const noexcept { return stopped_.load(std::memory_order_acquire); }

    std::string reason() const;

    // Hooks added after shutdown run immediately on the caller's thread.
    void add_stop_hook(StopHook hook);

    // Sleeps for `duration` unless shutdown is requested first. Returns true
    // when woken by shutdown.
    bool wait_for(std::chrono::duration<double> duration);

private:
    static void run_hook(const StopHook& hook);

    std::atomic<bool> stopped_{false};
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::vector<StopHook> hooks_;
    std::string reason_;
};

} // namespace replicator
