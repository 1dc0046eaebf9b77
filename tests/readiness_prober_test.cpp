#include <gtest/gtest.h>
#include "readiness_prober.hpp"
#include "fake_http_client.hpp"
#include "sync_errors.hpp"

#include <atomic>
#include <memory>
#include <thread>

using namespace std::chrono_literals;

TEST(PollWithDeadlineTest, SucceedsImmediately) {
    int calls = 0;
    EXPECT_EQ(pollWithDeadline([&] { ++calls; return true; }, 1s, 10ms), PollOutcome::SUCCEEDED);
    EXPECT_EQ(calls, 1);
}

TEST(PollWithDeadlineTest, RetriesUntilProbeSucceeds) {
    int calls = 0;
    EXPECT_EQ(pollWithDeadline([&] { return ++calls == 3; }, 5s, 10ms), PollOutcome::SUCCEEDED);
    EXPECT_EQ(calls, 3);
}

TEST(PollWithDeadlineTest, TimesOut) {
    int calls = 0;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(pollWithDeadline([&] { ++calls; return false; }, 100ms, 20ms), PollOutcome::TIMED_OUT);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(calls, 2);
    EXPECT_LT(elapsed, 2s);
}

TEST(PollWithDeadlineTest, ZeroTimeoutStillProbesOnce) {
    int calls = 0;
    EXPECT_EQ(pollWithDeadline([&] { ++calls; return false; }, 0ms, 10ms), PollOutcome::TIMED_OUT);
    EXPECT_EQ(calls, 1);
}

TEST(PollWithDeadlineTest, StopFlagCancelsWait) {
    std::atomic<bool> stop{false};
    std::thread stopper([&stop] {
        std::this_thread::sleep_for(50ms);
        stop = true;
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(pollWithDeadline([] { return false; }, 30s, 10s, &stop), PollOutcome::CANCELLED);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    stopper.join();
}

class ReadinessProberTest : public ::testing::Test {
protected:
    void SetUp() override {
        instance.host = "pi2.lan";
        instance.apiKey = "second";
    }

    InstanceConfig instance;
    std::shared_ptr<FakeHttpClient> client = std::make_shared<FakeHttpClient>();
    ReadinessProber prober{client, 10ms};
};

TEST_F(ReadinessProberTest, UnauthenticatedAnswerMeansReady) {
    client->on("pi2.lan", "GET /api/auth", 401, R"({"session":{"valid":false}})");
    EXPECT_TRUE(prober.probeOnce(instance));
    EXPECT_EQ(prober.waitReady(instance, 1s), Readiness::READY);

    const auto probes = client->requests("pi2.lan", "GET /api/auth");
    ASSERT_FALSE(probes.empty());
    EXPECT_EQ(probes[0].request.headers.count("sid"), 0u);
}

TEST_F(ReadinessProberTest, BecomesReadyAfterRestart) {
    client->fail("pi2.lan", "GET /api/auth", "connection refused");
    client->on("pi2.lan", "GET /api/auth", 503, "starting");
    client->on("pi2.lan", "GET /api/auth", 200, R"({"session":{"valid":true}})");

    EXPECT_EQ(prober.waitReady(instance, 5s), Readiness::READY);
    EXPECT_EQ(client->count("pi2.lan", "GET /api/auth"), 3u);
}

TEST_F(ReadinessProberTest, TimesOutWhileUnreachable) {
    client->fail("pi2.lan", "GET /api/auth", "connection refused");
    EXPECT_FALSE(prober.probeOnce(instance));
    EXPECT_EQ(prober.waitReady(instance, 50ms), Readiness::TIMED_OUT);
}

TEST_F(ReadinessProberTest, RequireReadyThrowsOnTimeout) {
    client->on("pi2.lan", "GET /api/auth", 503, "starting");
    EXPECT_THROW(prober.requireReady(instance, 30ms), ReadinessTimeout);

    try {
        prober.requireReady(instance, 1s, nullptr);
        FAIL() << "expected ReadinessTimeout";
    } catch (const ReadinessTimeout& e) {
        EXPECT_STREQ(e.what(), "[pi2.lan:443] API not ready after 1s");
    }
}

TEST_F(ReadinessProberTest, RequireReadyReturnsWhenReady) {
    client->on("pi2.lan", "GET /api/auth", 401, "{}");
    EXPECT_NO_THROW(prober.requireReady(instance, 1s));
}

TEST_F(ReadinessProberTest, StopRequestEndsWait) {
    client->on("pi2.lan", "GET /api/auth", 502, "");
    std::atomic<bool> stop{true};
    EXPECT_EQ(prober.waitReady(instance, 10s, &stop), Readiness::TIMED_OUT);
}
