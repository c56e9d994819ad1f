#pragma once

#include <chrono>
#include <ctime>

namespace cw::util {

// Source of "now" for expiry checks and row timestamps. Components read it once per
// operation so a share cannot flip effectiveness mid-transaction.
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual std::time_t now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] std::time_t now() const override {
        return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    }
};

}
