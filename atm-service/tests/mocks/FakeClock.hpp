#pragma once

#include "ports/output/IClock.hpp"
#include <mutex>

namespace atm::tests::mocks {

/**
 * @brief Управляемые часы для тестов сроков сессий
 */
class FakeClock : public ports::output::IClock {
public:
    FakeClock()
        : now_(std::chrono::system_clock::time_point(std::chrono::seconds(1700000000)))
    {}

    std::chrono::system_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::system_clock::duration delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point now_;
};

} // namespace atm::tests::mocks
