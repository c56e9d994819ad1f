#include "concurrency/AsyncService.hpp"

#include <spdlog/spdlog.h>

using namespace cw::concurrency;

AsyncService::AsyncService(std::string serviceName, std::shared_ptr<spdlog::logger> logger)
    : serviceName_(std::move(serviceName)), log_(std::move(logger)) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();  // previous loop ended on its own

    {
        std::lock_guard lock(waitMtx_);
        stopRequested_.store(false, std::memory_order_release);
    }
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log_->error("[{}] Loop terminated: {}", serviceName_, e.what());
        }
        running_.store(false, std::memory_order_release);
    });

    log_->info("[{}] Started", serviceName_);
}

void AsyncService::requestStop() {
    {
        std::lock_guard lock(waitMtx_);
        stopRequested_.store(true, std::memory_order_release);
    }
    wake_.notify_all();
}

void AsyncService::stop() {
    requestStop();

    if (!worker_.joinable() || std::this_thread::get_id() == worker_.get_id()) return;

    worker_.join();
    running_.store(false, std::memory_order_release);
    log_->info("[{}] Stopped", serviceName_);
}
