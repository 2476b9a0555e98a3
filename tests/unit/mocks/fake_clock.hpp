#pragma once
#include <gmock/gmock.h>

#include <chrono>
#include <mutex>
#include <string>

#include "util/clock.hpp"
#include "util/id_generator.hpp"

namespace itemvault::tests {

// Manually advanced clock, starts at 2024-01-01T00:00:00.000Z
class FakeClock : public util::IClock {
public:
    FakeClock() : now_(std::chrono::milliseconds(1704067200000LL)) {}

    model::Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

    void set(model::Timestamp ts) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = ts;
    }

private:
    mutable std::mutex mutex_;
    model::Timestamp now_;
};

class MockIdGenerator : public util::IIdGenerator {
public:
    MOCK_METHOD(std::string, next_id, (), (override));
};

}  // namespace itemvault::tests
