#include "core/connectivity_probe.hpp"

#include <atomic>
#include <thread>

#include <gtest/gtest.h>

TEST(ConnectivityProbeTest, ReportsReachableHost) {
    ConnectivityProbe probe("github.com", 443, std::chrono::milliseconds(100),
        [](const std::string& host, int port, std::chrono::milliseconds) {
            return host == "github.com" && port == 443;
        });
    probe.start();

    ConnectivityStatus status = probe.await(std::chrono::seconds(5));

    EXPECT_TRUE(status.completed);
    EXPECT_TRUE(status.reachable);
    EXPECT_EQ(status.target, "github.com:443");
}

TEST(ConnectivityProbeTest, ReportsUnreachableHost) {
    ConnectivityProbe probe("github.com", 443, std::chrono::milliseconds(100),
        [](const std::string&, int, std::chrono::milliseconds) { return false; });
    probe.start();

    ConnectivityStatus status = probe.await(std::chrono::seconds(5));

    EXPECT_TRUE(status.completed);
    EXPECT_FALSE(status.reachable);
}

TEST(ConnectivityProbeTest, SlowProbeIsNotCompleted) {
    auto release = std::make_shared<std::atomic<bool>>(false);
    ConnectivityProbe probe("github.com", 443, std::chrono::milliseconds(100),
        [release](const std::string&, int, std::chrono::milliseconds) {
            while (!release->load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return true;
        });
    probe.start();

    ConnectivityStatus early = probe.await(std::chrono::milliseconds(10));
    EXPECT_FALSE(early.completed);
    EXPECT_FALSE(early.reachable);

    release->store(true);
    ConnectivityStatus late = probe.await(std::chrono::seconds(5));
    EXPECT_TRUE(late.completed);
    EXPECT_TRUE(late.reachable);
}

TEST(ConnectivityProbeTest, ResultIsAssignedOnce) {
    std::atomic<int> calls{0};
    ConnectivityProbe probe("mirror.invalid", 80, std::chrono::milliseconds(100),
        [&calls](const std::string&, int, std::chrono::milliseconds) { return ++calls == 1; });
    probe.start();
    probe.start();

    EXPECT_TRUE(probe.await(std::chrono::seconds(5)).reachable);
    EXPECT_TRUE(probe.await(std::chrono::seconds(5)).reachable);
    EXPECT_EQ(calls.load(), 1);
}

TEST(ConnectivityProbeTest, AwaitWithoutStartIsNotCompleted) {
    ConnectivityProbe probe("github.com", 443, std::chrono::milliseconds(100),
        [](const std::string&, int, std::chrono::milliseconds) { return true; });

    EXPECT_FALSE(probe.await(std::chrono::milliseconds(1)).completed);
}
