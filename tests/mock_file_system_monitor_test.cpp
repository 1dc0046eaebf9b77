#include <gtest/gtest.h>
#include "mock_file_system_monitor.hpp"
#include <thread>
#include <chrono>
#include <atomic>
#include <vector>
#include <string>

class MockFileSystemMonitorTest : public ::testing::Test {
protected:
    MockFileSystemMonitor monitor;
};

// Test that event simulation works
TEST_F(MockFileSystemMonitorTest, SimulateEvent) {
    std::string eventPath;
    bool callbackCalled = false;

    monitor.setCallback([&callbackCalled, &eventPath](const std::string& path) {
        callbackCalled = true;
        eventPath = path;
    });

    monitor.simulateEvent("/etc/pihole/pihole.toml", "close_write", 0);

    EXPECT_TRUE(callbackCalled);
    EXPECT_EQ(eventPath, "/etc/pihole/pihole.toml");
    EXPECT_FALSE(monitor.empty());

    auto event = monitor.getNextEvent();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->path, "/etc/pihole/pihole.toml");
    EXPECT_EQ(event->action, "close_write");

    EXPECT_TRUE(monitor.empty());
}

// Events come out in the order they were queued
TEST_F(MockFileSystemMonitorTest, MultipleEvents) {
    monitor.simulateEvent("/etc/pihole/pihole.toml", "create", 1);
    monitor.simulateEvent("/etc/pihole/pihole.toml", "modify", 2);
    monitor.simulateEvent("/etc/pihole/pihole.toml", "close_write", 4);

    auto event1 = monitor.getNextEvent();
    ASSERT_TRUE(event1.has_value());
    EXPECT_EQ(event1->action, "create");
    EXPECT_EQ(event1->mask, 1u);

    auto event2 = monitor.getNextEvent();
    ASSERT_TRUE(event2.has_value());
    EXPECT_EQ(event2->action, "modify");
    EXPECT_EQ(event2->mask, 2u);

    auto event3 = monitor.getNextEvent();
    ASSERT_TRUE(event3.has_value());
    EXPECT_EQ(event3->action, "close_write");
    EXPECT_EQ(event3->mask, 4u);

    EXPECT_FALSE(monitor.getNextEvent().has_value());
}

TEST_F(MockFileSystemMonitorTest, WatchAndUnwatch) {
    monitor.addWatch("/etc/pihole/pihole.toml");
    EXPECT_TRUE(monitor.isWatching("/etc/pihole/pihole.toml"));

    monitor.removeWatch("/etc/pihole/pihole.toml");
    EXPECT_FALSE(monitor.isWatching("/etc/pihole/pihole.toml"));
}

TEST_F(MockFileSystemMonitorTest, WaitForEventsWakesOnEvent) {
    std::thread producer([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        monitor.simulateEvent("/etc/pihole/pihole.toml", "modify");
    });

    EXPECT_TRUE(monitor.waitForEvents(std::chrono::seconds(5)));
    producer.join();
}

TEST_F(MockFileSystemMonitorTest, WaitForEventsTimesOut) {
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(monitor.waitForEvents(std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(45));
}

TEST_F(MockFileSystemMonitorTest, StopReleasesWaiter) {
    std::atomic<bool> returned{false};
    std::thread waiter([this, &returned] {
        monitor.waitForEvents(std::chrono::seconds(30));
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    monitor.stop();
    waiter.join();

    EXPECT_TRUE(returned);
    EXPECT_TRUE(monitor.stopped());
}

// Test concurrent event handling
TEST_F(MockFileSystemMonitorTest, ConcurrentEvents) {
    std::atomic<int> callbackCount{0};
    monitor.setCallback([&callbackCount](const std::string&) {
        callbackCount++;
    });

    const int numThreads = 5;
    const int eventsPerThread = 20;
    std::vector<std::thread> threads;

    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([this, i]() {
            for (int j = 0; j < eventsPerThread; ++j) {
                monitor.simulateEvent("/tmp/thread" + std::to_string(i), "modify", i * 100 + j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(callbackCount, numThreads * eventsPerThread);

    int eventCount = 0;
    while (monitor.getNextEvent()) {
        eventCount++;
    }
    EXPECT_EQ(eventCount, numThreads * eventsPerThread);
}
