#include "gtest/gtest.h"
#include <atomic>
#include <chrono>
#include <thread>
#include "admission.hpp"

using namespace std;
using namespace codebox;

TEST(AdmissionGateTest, ZeroCapacityTest) {
    EXPECT_THROW(admission_gate(0), invalid_argument);
}

TEST(AdmissionGateTest, SaturationTest) {
    admission_gate gate(2);
    EXPECT_EQ(gate.capacity(), 2u);
    EXPECT_FALSE(gate.saturated());

    auto first = gate.try_acquire();
    ASSERT_TRUE(first);
    EXPECT_EQ(gate.in_use(), 1u);

    admission_permit second = gate.acquire();
    EXPECT_EQ(gate.in_use(), 2u);
    EXPECT_TRUE(gate.saturated());
    EXPECT_FALSE(gate.try_acquire());
}

TEST(AdmissionGateTest, ReleaseOnScopeExitTest) {
    admission_gate gate(1);
    {
        admission_permit permit = gate.acquire();
        EXPECT_TRUE(gate.saturated());
    }
    EXPECT_EQ(gate.in_use(), 0u);
    EXPECT_TRUE(gate.try_acquire());
    EXPECT_EQ(gate.in_use(), 0u);
}

TEST(AdmissionGateTest, MovedPermitReleasesOnceTest) {
    admission_gate gate(2);
    {
        admission_permit permit = gate.acquire();
        admission_permit moved(move(permit));
        EXPECT_EQ(gate.in_use(), 1u);
    }
    EXPECT_EQ(gate.in_use(), 0u);
}

TEST(AdmissionGateTest, BlockingAcquireTest) {
    admission_gate gate(1);
    optional<admission_permit> held = gate.acquire();
    atomic<bool> acquired(false);

    thread waiter([&] {
        admission_permit permit = gate.acquire();
        acquired = true;
    });

    this_thread::sleep_for(chrono::milliseconds(100));
    EXPECT_FALSE(acquired);

    held.reset();
    waiter.join();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(gate.in_use(), 0u);
}
