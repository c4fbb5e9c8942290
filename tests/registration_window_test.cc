#include "carvenet/registration_window.h"

#include <gtest/gtest.h>

#include <chrono>

namespace carvenet {

using std::chrono::seconds;

TEST(RegistrationWindow, ClosesAtDeadline)
{
    ManualClock clock;
    RegistrationWindow window(&clock, seconds(30));
    EXPECT_FALSE(window.is_open());

    window.open();
    EXPECT_TRUE(window.is_open());
    EXPECT_EQ(window.remaining(), seconds(30));

    clock.advance(seconds(29));
    EXPECT_TRUE(window.is_open());
    EXPECT_EQ(window.remaining(), seconds(1));

    clock.advance(seconds(1));
    EXPECT_FALSE(window.is_open());
    EXPECT_EQ(window.remaining(), Clock::duration::zero());
}


TEST(RegistrationWindow, ClosesEarlyWhenExpectedWorkersJoin)
{
    ManualClock clock;
    RegistrationWindow window(&clock, seconds(30), 2);
    window.open();

    window.note_registered();
    EXPECT_TRUE(window.is_open());
    window.note_registered();
    EXPECT_FALSE(window.is_open());
    EXPECT_EQ(window.registered(), 2U);
}


TEST(RegistrationWindow, ExplicitClose)
{
    ManualClock clock;
    RegistrationWindow window(&clock, seconds(30));
    window.open();
    window.close();
    EXPECT_FALSE(window.is_open());

    // Reopening restarts the deadline from the current time.
    clock.advance(seconds(100));
    window.open();
    EXPECT_TRUE(window.is_open());
    EXPECT_EQ(window.remaining(), seconds(30));
}


TEST(RegistrationWindow, ZeroLengthWindowIsClosed)
{
    ManualClock clock;
    RegistrationWindow window(&clock, Clock::duration::zero());
    window.open();
    EXPECT_FALSE(window.is_open());
}


TEST(RegistrationWindow, DefaultsToSteadyClock)
{
    RegistrationWindow window(nullptr, seconds(60));
    window.open();
    EXPECT_TRUE(window.is_open());
    EXPECT_GT(window.remaining(), seconds(50));
}


TEST(ManualClock, SetAndAdvance)
{
    ManualClock clock;
    const Clock::time_point start = clock.now();
    clock.advance(seconds(5));
    EXPECT_EQ(clock.now() - start, seconds(5));
    clock.set(start);
    EXPECT_EQ(clock.now(), start);
}

}  // namespace carvenet
