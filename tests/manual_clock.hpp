#pragma once

#include "storage/cancellation.hpp"

#include <chrono>

namespace docdb::storage {

// Deadline clock that only moves through advance().
class ManualClock final : public DeadlineClock {
public:
    [[nodiscard]] time_point now() const override { return now_; }

    void advance(std::chrono::milliseconds delta) { now_ += delta; }

private:
    time_point now_{};
};

} // namespace docdb::storage
