#include "wifi_single_flight.hpp"
#include <gtest/gtest.h>
#include <thread>

namespace wifiprov {

TEST(SingleFlightTest, SecondAcquireFailsUntilRelease) {
    SingleFlight guard;

    SingleFlight::Ticket first = guard.tryAcquire("first");
    ASSERT_TRUE(first);
    EXPECT_TRUE(guard.busy());

    SingleFlight::Ticket second = guard.tryAcquire("second");
    EXPECT_FALSE(second);

    first.release();
    EXPECT_FALSE(guard.busy());
    EXPECT_TRUE(guard.tryAcquire("third"));
}

TEST(SingleFlightTest, TicketReleasesOnScopeExit) {
    SingleFlight guard;
    {
        auto ticket = guard.tryAcquire("scoped");
        EXPECT_TRUE(guard.busy());
    }
    EXPECT_FALSE(guard.busy());
}

TEST(SingleFlightTest, MovedTicketReleasesOnOtherThread) {
    SingleFlight guard;
    SingleFlight::Ticket ticket = guard.tryAcquire("handover");

    std::thread worker([held = std::move(ticket)]() mutable { held.release(); });
    worker.join();

    EXPECT_FALSE(ticket);
    EXPECT_FALSE(guard.busy());
}

TEST(SingleFlightTest, MoveAssignmentReleasesPreviousHold) {
    SingleFlight a;
    SingleFlight b;
    SingleFlight::Ticket ticket = a.tryAcquire("a");

    ticket = b.tryAcquire("b");

    EXPECT_FALSE(a.busy());
    EXPECT_TRUE(b.busy());
}

} // namespace wifiprov
