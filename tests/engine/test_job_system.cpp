/**
 * @file test_job_system.cpp
 * @brief Unit tests for the worker pool behind parallel depot cloning
 */

#include <gtest/gtest.h>

#include "core/JobSystem.hpp"
#include "ability/SkillDepot.hpp"

#include "utils/TestHelpers.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace Forge;
using namespace Forge::Test;

// =============================================================================
// Job System Tests
// =============================================================================

class JobSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& js = JobSystem::Instance();
        if (!js.IsInitialized()) {
            JobSystemConfig config;
            config.workerThreads = 2;
            js.Initialize(config);
        }
    }
};

TEST_F(JobSystemTest, IsInitialized) {
    EXPECT_TRUE(JobSystem::Instance().IsInitialized());
    EXPECT_GT(JobSystem::Instance().GetWorkerCount(), 0u);
}

TEST_F(JobSystemTest, FillsEveryDepotSlotOnce) {
    const Ability::SkillDepot base = MakeDepot("Fire", {{"DMG", 10.0f}});
    std::vector<Ability::SkillDepot> depots(1000);
    std::vector<std::atomic<int>> visits(depots.size());

    JobSystem::Instance().ParallelFor(depots.size(), [&](size_t i) {
        depots[i] = base;
        depots[i].depotId = static_cast<uint32_t>(i);
        visits[i]++;
    });

    for (size_t i = 0; i < depots.size(); ++i) {
        EXPECT_EQ(1, visits[i].load());
        EXPECT_EQ(i, depots[i].depotId);
        EXPECT_SPECIAL_EQ(depots[i], "Fire", "DMG", 10.0f);
    }
}

TEST_F(JobSystemTest, RangeTouchesOnlyItsSlots) {
    std::vector<uint32_t> ids(100, 0);

    JobSystem::Instance().ParallelFor(10, 90, 7, [&ids](size_t i) {
        ids[i] = static_cast<uint32_t>(i);
    });

    EXPECT_EQ(0u, ids[9]);
    EXPECT_EQ(10u, ids[10]);
    EXPECT_EQ(89u, ids[89]);
    EXPECT_EQ(0u, ids[90]);
}

TEST_F(JobSystemTest, EmptyRangeCallsNothing) {
    std::atomic<int> calls{0};
    JobSystem::Instance().ParallelFor(0, [&calls](size_t) { calls++; });
    JobSystem::Instance().ParallelFor(5, 5, 1, [&calls](size_t) { calls++; });
    EXPECT_EQ(0, calls.load());
}

TEST_F(JobSystemTest, NestedParallelForRunsInline) {
    std::atomic<int> total{0};

    JobSystem::Instance().ParallelFor(8, [&total](size_t) {
        JobSystem::Instance().ParallelFor(8, [&total](size_t) {
            total++;
        });
    });

    EXPECT_EQ(64, total.load());
}

TEST_F(JobSystemTest, ManySmallBatchesCompleteCleanly) {
    // Each round destroys its counter right after the last worker signals it
    for (int round = 0; round < 20000; ++round) {
        std::atomic<int> sum{0};
        JobSystem::Instance().ParallelFor(0, 8, 1, [&sum](size_t i) {
            sum += static_cast<int>(i);
        });
        ASSERT_EQ(28, sum.load()) << "round " << round;
    }
}

// =============================================================================
// Failure Tests
// =============================================================================

TEST_F(JobSystemTest, FailedBatchRethrowsToCaller) {
    std::vector<std::atomic<int>> visits(64);

    EXPECT_THROW(
        JobSystem::Instance().ParallelFor(0, visits.size(), 4, [&visits](size_t i) {
            if (i == 37) {
                throw std::runtime_error("copy failed");
            }
            visits[i]++;
        }),
        std::runtime_error);

    // The failing batch stops at the throw; every other batch still runs
    for (size_t i = 0; i < visits.size(); ++i) {
        if (i >= 36 && i < 40) {
            continue;
        }
        EXPECT_EQ(1, visits[i].load()) << "index " << i;
    }
}

TEST_F(JobSystemTest, FailureKeepsFirstException) {
    try {
        JobSystem::Instance().ParallelFor(0, 16, 1, [](size_t i) {
            throw std::out_of_range("slot " + std::to_string(i));
        });
        FAIL() << "expected an exception";
    } catch (const std::out_of_range& e) {
        EXPECT_EQ(0u, std::string(e.what()).rfind("slot ", 0));
    }
}

TEST_F(JobSystemTest, UsableAfterFailure) {
    EXPECT_THROW(
        JobSystem::Instance().ParallelFor(0, 8, 1, [](size_t) {
            throw std::runtime_error("boom");
        }),
        std::runtime_error);

    std::atomic<int> calls{0};
    JobSystem::Instance().ParallelFor(0, 8, 1, [&calls](size_t) { calls++; });
    EXPECT_EQ(8, calls.load());
}

// =============================================================================
// Job Counter Tests
// =============================================================================

TEST(JobCounterTest, TracksOutstandingWork) {
    JobCounter counter(2);
    EXPECT_FALSE(counter.IsComplete());

    counter.Decrement();
    EXPECT_FALSE(counter.IsComplete());

    counter.Decrement();
    EXPECT_TRUE(counter.IsComplete());

    counter.Increment(3);
    EXPECT_FALSE(counter.IsComplete());
}

TEST(JobCounterTest, WaitRethrowsRecordedFailureOnce) {
    JobCounter counter(1);
    counter.Fail(std::make_exception_ptr(std::runtime_error("first")));
    counter.Fail(std::make_exception_ptr(std::logic_error("second")));
    counter.Decrement();

    EXPECT_THROW(counter.Wait(), std::runtime_error);
    EXPECT_NO_THROW(counter.Wait());
}

TEST(JobCounterTest, DestroyedRightAfterWait) {
    for (int round = 0; round < 2000; ++round) {
        auto counter = std::make_unique<JobCounter>(1);
        std::thread worker([raw = counter.get()]() { raw->Decrement(); });

        counter->Wait();
        counter.reset();
        worker.join();
    }
}
