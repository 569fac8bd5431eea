/**
 * @file test_deadline.cpp
 * @brief Unit tests for DeadlineSignal.
 * @author DeadlineGroup contributors
 */

#include "group/deadline.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace deadline_group;
using namespace std::chrono_literals;

TEST(DeadlineSignalTest, NoDeadlineIsManualOnly) {
    DeadlineSignal signal(Duration::zero());
    EXPECT_FALSE(signal.has_deadline());
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(signal.expired());

    signal.fire();
    EXPECT_TRUE(signal.expired());
    EXPECT_TRUE(signal.token().stop_requested());
}

TEST(DeadlineSignalTest, ExpiresAfterDuration) {
    DeadlineSignal signal(Duration{30});
    ASSERT_TRUE(signal.has_deadline());
    EXPECT_FALSE(signal.expired());

    std::this_thread::sleep_for(60ms);
    EXPECT_TRUE(signal.expired());
    EXPECT_TRUE(signal.token().stop_requested());
}

TEST(DeadlineSignalTest, FiringIsMonotonic) {
    DeadlineSignal signal(Duration{10'000});
    signal.fire();
    signal.fire();
    EXPECT_TRUE(signal.expired());
}

TEST(DeadlineSignalTest, AlreadyStoppedParentFiresImmediately) {
    std::stop_source parent;
    parent.request_stop();
    DeadlineSignal signal(Duration{10'000}, parent.get_token());
    EXPECT_TRUE(signal.expired());
}

TEST(DeadlineSignalTest, ParentStopPropagates) {
    std::stop_source parent;
    DeadlineSignal signal(Duration::zero(), parent.get_token());
    EXPECT_FALSE(signal.expired());
    parent.request_stop();
    EXPECT_TRUE(signal.expired());
}

TEST(DeadlineSignalTest, FiringDoesNotAffectParent) {
    std::stop_source parent;
    DeadlineSignal signal(Duration::zero(), parent.get_token());
    signal.fire();
    EXPECT_FALSE(parent.stop_requested());
}

TEST(DeadlineSignalTest, WaitReturnsWhenPredicateHolds) {
    DeadlineSignal signal(Duration{5'000});
    std::mutex m;
    std::condition_variable_any cv;
    bool ready = false;

    std::thread setter([&] {
        std::this_thread::sleep_for(20ms);
        {
            std::lock_guard lock(m);
            ready = true;
        }
        cv.notify_all();
    });

    std::unique_lock lock(m);
    EXPECT_TRUE(signal.wait(lock, cv, [&] { return ready; }));
    lock.unlock();
    setter.join();
    EXPECT_FALSE(signal.expired());
}

TEST(DeadlineSignalTest, WaitTimesOutAndFires) {
    DeadlineSignal signal(Duration{30});
    std::mutex m;
    std::condition_variable_any cv;

    auto start = SteadyClock::now();
    std::unique_lock lock(m);
    EXPECT_FALSE(signal.wait(lock, cv, [] { return false; }));
    EXPECT_GE(SteadyClock::now() - start, 30ms);
    EXPECT_TRUE(signal.expired());
}

TEST(DeadlineSignalTest, WaitWakesOnParentStop) {
    std::stop_source parent;
    DeadlineSignal signal(Duration::zero(), parent.get_token());
    std::mutex m;
    std::condition_variable_any cv;

    std::thread stopper([&] {
        std::this_thread::sleep_for(20ms);
        parent.request_stop();
    });

    std::unique_lock lock(m);
    EXPECT_FALSE(signal.wait(lock, cv, [] { return false; }));
    lock.unlock();
    stopper.join();
}

TEST(DeadlineSignalTest, CenturiesLongTimeoutSaturates) {
    DeadlineSignal signal(std::chrono::hours(24 * 365 * 400));
    ASSERT_TRUE(signal.has_deadline());
    EXPECT_GT(*signal.deadline(), SteadyClock::now() + std::chrono::hours(24 * 365));
    EXPECT_FALSE(signal.expired());
    EXPECT_FALSE(signal.token().stop_requested());
}
