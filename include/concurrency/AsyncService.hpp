#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace spdlog { class logger; }

namespace cw::concurrency {

// A named background loop on its own thread, logging to its subsystem's logger.
// Subclasses implement runLoop() and pace themselves with waitForStop().
class AsyncService {
public:
    AsyncService(std::string serviceName, std::shared_ptr<spdlog::logger> logger);

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual ~AsyncService();

    virtual void start();

    // Wakes the loop and joins it. Safe to call repeatedly.
    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] const std::string& serviceName() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::shared_ptr<spdlog::logger> log_;

    virtual void runLoop() = 0;

    [[nodiscard]] bool shouldStop() const { return stopRequested_.load(std::memory_order_acquire); }

    // Blocks for up to `timeout`; true once stop() has been requested
    template <typename Rep, typename Period>
    bool waitForStop(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(waitMtx_);
        return wake_.wait_for(lock, timeout, [this] { return shouldStop(); });
    }

private:
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::thread worker_;

    std::mutex waitMtx_;
    std::condition_variable wake_;

    void requestStop();
};

}
