#include "carvenet/registration_window.h"

namespace carvenet {

Clock::time_point
SteadyClock::now() const noexcept
{
    return std::chrono::steady_clock::now();
}


Clock::time_point
ManualClock::now() const noexcept
{
    return time_point(duration(ticks_.load(std::memory_order_acquire)));
}


void
ManualClock::advance(duration d) noexcept
{
    ticks_.fetch_add(d.count(), std::memory_order_acq_rel);
}


void
ManualClock::set(time_point t) noexcept
{
    ticks_.store(t.time_since_epoch().count(), std::memory_order_release);
}


const Clock&
default_clock() noexcept
{
    static const SteadyClock clock;
    return clock;
}


RegistrationWindow::RegistrationWindow(const Clock* clock,
                                       Clock::duration length,
                                       uint32_t expected_workers) noexcept
    : clock_(clock ? clock : &default_clock())
    , length_(length)
    , expected_(expected_workers)
{
}


void
RegistrationWindow::open() noexcept
{
    deadline_ = clock_->now() + length_;
    opened_   = true;
    closed_   = false;
}


void
RegistrationWindow::close() noexcept
{
    closed_ = true;
}


bool
RegistrationWindow::is_open() const noexcept
{
    if (!opened_ || closed_) {
        return false;
    }
    if (expected_ != 0U && registered_ >= expected_) {
        return false;
    }
    return clock_->now() < deadline_;
}


Clock::duration
RegistrationWindow::remaining() const noexcept
{
    if (!is_open()) {
        return Clock::duration::zero();
    }
    return deadline_ - clock_->now();
}


void
RegistrationWindow::note_registered() noexcept
{
    registered_ += 1U;
}

}  // namespace carvenet
