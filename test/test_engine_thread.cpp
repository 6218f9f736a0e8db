#include <gtest/gtest.h>

#include "Core/Warden/ConnectivityProbe.hpp"
#include "Core/Warden/EngineThread.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {

// Тело движка, работающее до запроса остановки.
int RunUntilStopped(std::stop_token st) {
    while (InterruptibleSleep(10s, st)) {
    }
    return 0;
}

} // namespace

TEST(EngineThread, FailedResultIsReturnedByWait) {
    EngineThread engine;
    ASSERT_TRUE(engine.Start([](std::stop_token) { return 1; }));
    EXPECT_EQ(1, engine.Wait());
    EXPECT_FALSE(engine.IsRunning());
}

TEST(EngineThread, StopRequestEndsRunWithZero) {
    EngineThread engine;
    ASSERT_TRUE(engine.Start(RunUntilStopped));
    EXPECT_TRUE(engine.IsRunning());
    EXPECT_TRUE(engine.RequestStop());
    EXPECT_EQ(0, engine.Wait());
    EXPECT_FALSE(engine.IsRunning());
}

TEST(EngineThread, SecondStartWhileRunningIsRefused) {
    EngineThread engine;
    ASSERT_TRUE(engine.Start(RunUntilStopped));
    std::atomic<bool> second_ran{false};
    EXPECT_FALSE(engine.Start([&second_ran](std::stop_token) {
        second_ran = true;
        return 1;
    }));
    engine.RequestStop();
    EXPECT_EQ(0, engine.Wait());
    EXPECT_FALSE(second_ran.load());
}

TEST(EngineThread, RestartsAfterPreviousRunFinished) {
    EngineThread engine;
    ASSERT_TRUE(engine.Start([](std::stop_token) { return 2; }));
    EXPECT_EQ(2, engine.Wait());
    ASSERT_TRUE(engine.Start([](std::stop_token) { return 0; }));
    EXPECT_EQ(0, engine.Wait());
}

TEST(EngineThread, ExceptionFromBodyIsFailure) {
    EngineThread engine;
    ASSERT_TRUE(engine.Start([](std::stop_token) -> int { throw std::runtime_error("boom"); }));
    EXPECT_EQ(1, engine.Wait());
    EXPECT_FALSE(engine.IsRunning());
}

TEST(EngineThread, StopWhenIdleIsRejected) {
    EngineThread engine;
    EXPECT_FALSE(engine.RequestStop());
    EXPECT_EQ(0, engine.Wait());
}

TEST(EngineThread, DestructionStopsAndJoinsRunningEngine) {
    std::atomic<bool> finished{false};
    {
        EngineThread engine;
        ASSERT_TRUE(engine.Start([&finished](std::stop_token st) {
            const int rc = RunUntilStopped(st);
            finished = true;
            return rc;
        }));
    }
    EXPECT_TRUE(finished.load());
}

TEST(EngineThread, FinishedThreadIsJoinedOnDestruction) {
    std::atomic<bool> ran{false};
    {
        EngineThread engine;
        ASSERT_TRUE(engine.Start([&ran](std::stop_token) {
            ran = true;
            return 1;
        }));
        while (engine.IsRunning()) std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(ran.load());
}
