#include "storage/cancellation.hpp"

#include "common/error.hpp"

namespace docdb::storage {

namespace {

class SteadyDeadlineClock final : public DeadlineClock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::steady_clock::now();
    }
};

} // anonymous namespace

const DeadlineClock& DeadlineClock::steady() {
    static const SteadyDeadlineClock clock;
    return clock;
}

std::error_code CancellationToken::check() const {
    if (!state_) {
        return {};
    }
    if (state_->cancelled.load(std::memory_order_acquire)) {
        return make_error_code(errc::cancelled);
    }
    if (state_->deadline && state_->clock->now() >= *state_->deadline) {
        return make_error_code(errc::deadline_exceeded);
    }
    return {};
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>())
{}

CancellationSource CancellationSource::with_deadline(DeadlineClock::time_point deadline,
                                                     const DeadlineClock& clock) {
    CancellationSource source;
    source.state_->deadline = deadline;
    source.state_->clock = &clock;
    return source;
}

CancellationSource CancellationSource::with_timeout(std::chrono::milliseconds timeout,
                                                    const DeadlineClock& clock) {
    return with_deadline(clock.now() + timeout, clock);
}

void CancellationSource::cancel() noexcept {
    state_->cancelled.store(true, std::memory_order_release);
}

bool CancellationSource::cancelled() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
}

} // namespace docdb::storage
