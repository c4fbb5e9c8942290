#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

/**
 * \file registration_window.h
 * \brief Worker registration deadline, driven by an injectable clock.
 */

namespace carvenet {

/// Monotonic time source.
class Clock {
public:
    using duration   = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const noexcept = 0;
};

/// \ref Clock backed by `std::chrono::steady_clock`.
class SteadyClock final : public Clock {
public:
    time_point now() const noexcept override;
};

/// \ref Clock that only moves when told to. Safe to advance from any thread.
class ManualClock final : public Clock {
public:
    time_point now() const noexcept override;

    void advance(duration d) noexcept;
    void set(time_point t) noexcept;

private:
    std::atomic<duration::rep> ticks_ { 0 };
};

/// Process-wide \ref SteadyClock instance.
const Clock&
default_clock() noexcept;

/**
 * \brief Registration phase of a coordinator run.
 *
 * The window is open from \ref open until its deadline passes, until
 * \p expected_workers registrations were counted (when non-zero), or until
 * \ref close is called, whichever comes first.
 *
 * Not thread-safe; the owner serializes access.
 */
class RegistrationWindow final {
public:
    RegistrationWindow(const Clock* clock, Clock::duration length,
                       uint32_t expected_workers = 0) noexcept;

    /// Starts the window at the clock's current time.
    void open() noexcept;
    void close() noexcept;

    bool is_open() const noexcept;
    /// Time until the deadline (zero once closed or past it).
    Clock::duration remaining() const noexcept;

    void note_registered() noexcept;
    uint32_t registered() const noexcept { return registered_; }
    uint32_t expected_workers() const noexcept { return expected_; }

private:
    const Clock* clock_ = nullptr;
    Clock::duration length_ {};
    Clock::time_point deadline_ {};
    uint32_t expected_   = 0;
    uint32_t registered_ = 0;
    bool opened_         = false;
    bool closed_         = false;
};

}  // namespace carvenet
