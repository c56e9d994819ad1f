#include "database/DBPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace cw::database;

DBPool::DBPool(const std::string& connectionString, const size_t size) : size_(size) {
    if (size == 0) throw std::invalid_argument("Database pool size must be at least 1");

    idle_.reserve(size);
    for (size_t i = 0; i < size; ++i) idle_.push_back(std::make_unique<DBConnection>(connectionString));

    log::Registry::db()->info("[DBPool] Opened {} connections", size);
}

DBPool::Lease DBPool::acquire() {
    std::unique_lock lock(mtx_);
    cv_.wait(lock, [&]() { return !idle_.empty(); });
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return {shared_from_this(), std::move(conn)};
}

void DBPool::release(std::unique_ptr<DBConnection> conn) {
    {
        std::lock_guard lock(mtx_);
        idle_.push_back(std::move(conn));
    }
    cv_.notify_one();
}
