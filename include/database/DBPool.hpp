#pragma once

#include "database/DBConnection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cw::database {

class DBPool : public std::enable_shared_from_this<DBPool> {
  public:
    // Borrowed connection; goes back to the pool when the lease is destroyed.
    class Lease {
      public:
        Lease(std::shared_ptr<DBPool> pool, std::unique_ptr<DBConnection> conn)
            : pool_(std::move(pool)), conn_(std::move(conn)) {}
        Lease(Lease&&) noexcept = default;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease() { if (pool_ && conn_) pool_->release(std::move(conn_)); }

        DBConnection& operator*() const { return *conn_; }
        DBConnection* operator->() const { return conn_.get(); }

      private:
        std::shared_ptr<DBPool> pool_;
        std::unique_ptr<DBConnection> conn_;
    };

    DBPool(const std::string& connectionString, size_t size);

    // Blocks until a connection is free
    Lease acquire();

    [[nodiscard]] size_t size() const { return size_; }

  private:
    std::vector<std::unique_ptr<DBConnection>> idle_;
    size_t size_;
    std::mutex mtx_;
    std::condition_variable cv_;

    void release(std::unique_ptr<DBConnection> conn);
};

} // namespace cw::database
