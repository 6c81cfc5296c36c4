#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>

namespace docdb::storage {

// ── DeadlineClock ────────────────────────────────────────────────────────────
//
// Time source deadlines are measured against.  Tests substitute a clock that
// only moves when told to.

class DeadlineClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~DeadlineClock() = default;

    [[nodiscard]] virtual time_point now() const = 0;

    // Process-wide std::chrono::steady_clock, used when no clock is supplied.
    [[nodiscard]] static const DeadlineClock& steady();
};

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::optional<DeadlineClock::time_point> deadline;
    const DeadlineClock* clock = nullptr;
};

} // namespace detail

// ── CancellationToken ────────────────────────────────────────────────────────
//
// Read side of a cancellation signal.  Passed to Engine::begin() and checked
// by every storage operation before it does any work.  A default-constructed
// token is never cancelled.  Cheap to copy.

class CancellationToken {
public:
    CancellationToken() = default;

    // Returns errc::cancelled once the source was cancelled,
    // errc::deadline_exceeded once the deadline has passed, success otherwise.
    [[nodiscard]] std::error_code check() const;

    [[nodiscard]] bool can_be_cancelled() const noexcept { return state_ != nullptr; }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<const detail::CancellationState> state)
        : state_(std::move(state))
    {}

    std::shared_ptr<const detail::CancellationState> state_;
};

// ── CancellationSource ───────────────────────────────────────────────────────
//
// Write side.  cancel() is thread-safe and idempotent; it may be called from
// another thread while a transaction is running, and is observed at the next
// storage operation.

class CancellationSource {
public:
    CancellationSource();

    // Source whose tokens also report errc::deadline_exceeded once `clock`
    // reaches `deadline`.
    [[nodiscard]] static CancellationSource with_deadline(
        DeadlineClock::time_point deadline, const DeadlineClock& clock = DeadlineClock::steady());

    [[nodiscard]] static CancellationSource with_timeout(
        std::chrono::milliseconds timeout, const DeadlineClock& clock = DeadlineClock::steady());

    void cancel() noexcept;

    [[nodiscard]] bool cancelled() const noexcept;

    [[nodiscard]] CancellationToken token() const { return CancellationToken{state_}; }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace docdb::storage
