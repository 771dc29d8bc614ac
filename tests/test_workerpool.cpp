// tests/test_workerpool.cpp
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/core/WorkerPool.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;

TEST(WorkerPoolTest, RunsEveryTask) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    WorkerPool pool(4, logger);
    std::atomic<int> done{0};

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.enqueue([&done] { ++done; }));
    }
    pool.waitIdle();
    EXPECT_EQ(done.load(), 100);
}

TEST(WorkerPoolTest, ThrowingTaskIsLoggedAndPoolKeepsWorking) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    EXPECT_CALL(*logger, error(HasSubstr("task failed"))).Times(1);
    EXPECT_CALL(*logger, error(HasSubstr("Unknown exception"))).Times(1);

    WorkerPool pool(1, logger);
    std::atomic<int> done{0};
    pool.enqueue([] { throw std::runtime_error("task failed"); });
    pool.enqueue([] { throw 7; });
    pool.enqueue([&done] { ++done; });
    pool.waitIdle();

    EXPECT_EQ(done.load(), 1);
    EXPECT_EQ(pool.failedTasks(), 2u);
}

TEST(WorkerPoolTest, ShutdownDrainsQueueAndRejectsNewTasks) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    std::atomic<int> done{0};
    WorkerPool pool(2, logger);
    for (int i = 0; i < 20; ++i) {
        pool.enqueue([&done] { ++done; });
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 20);

    EXPECT_CALL(*logger, error(_)).Times(1);
    EXPECT_FALSE(pool.enqueue([&done] { ++done; }));
    EXPECT_NO_THROW(pool.shutdown());
}

TEST(WorkerPoolTest, EveryAcceptedTaskRunsWhenShutdownRacesEnqueue) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    for (int round = 0; round < 50; ++round) {
        std::atomic<int> accepted{0};
        std::atomic<int> done{0};
        WorkerPool pool(2, logger);

        std::thread producer([&pool, &accepted, &done] {
            for (int i = 0; i < 200; ++i) {
                if (!pool.enqueue([&done] { ++done; })) {
                    return;
                }
                ++accepted;
            }
        });
        std::this_thread::yield();
        pool.shutdown();
        producer.join();

        ASSERT_EQ(done.load(), accepted.load()) << "round " << round;
    }
}

TEST(WorkerPoolTest, IdlePoolShutsDownRepeatedly) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    for (int round = 0; round < 1000; ++round) {
        WorkerPool pool(4, logger);
    }
    SUCCEED();
}

TEST(WorkerPoolTest, RejectsBadArguments) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    EXPECT_THROW(WorkerPool(0, logger), std::invalid_argument);
    EXPECT_THROW(WorkerPool(2, nullptr), std::invalid_argument);
}
