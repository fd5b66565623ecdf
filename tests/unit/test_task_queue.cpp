#include "core/task_queue.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace medscribe::core;

class TaskQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        task_queue = std::make_shared<TaskQueue>();
    }

    void TearDown() override {
        task_queue->shutdown();
    }

    std::shared_ptr<TaskQueue> task_queue;
};

// Test basic task enqueueing and dequeueing
TEST_F(TaskQueueTest, BasicEnqueueDequeue) {
    std::atomic<int> counter{0};

    EXPECT_TRUE(task_queue->enqueue([&counter]() { counter++; }));
    EXPECT_EQ(task_queue->size(), 1u);
    EXPECT_FALSE(task_queue->empty());

    auto task = task_queue->dequeue();
    ASSERT_TRUE(static_cast<bool>(task));
    task();

    EXPECT_EQ(counter.load(), 1);
    EXPECT_TRUE(task_queue->empty());
}

// Tasks come out in submission order
TEST_F(TaskQueueTest, FifoOrder) {
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        task_queue->enqueue([&order, i]() { order.push_back(i); });
    }

    for (int i = 0; i < 5; ++i) {
        task_queue->dequeue()();
    }

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(TaskQueueTest, EmptyTaskIsRejected) {
    EXPECT_FALSE(task_queue->enqueue(TaskQueue::Task()));
    EXPECT_TRUE(task_queue->empty());
}

// Pending work is still handed out after shutdown
TEST_F(TaskQueueTest, ShutdownDrainsThenStops) {
    task_queue->enqueue([]() {});
    task_queue->shutdown();

    EXPECT_TRUE(task_queue->isShuttingDown());
    EXPECT_FALSE(task_queue->enqueue([]() {}));
    EXPECT_TRUE(static_cast<bool>(task_queue->dequeue()));
    EXPECT_FALSE(static_cast<bool>(task_queue->dequeue()));
}

TEST_F(TaskQueueTest, ShutdownWakesBlockedConsumer) {
    std::atomic<bool> returned{false};
    std::thread consumer([this, &returned]() {
        auto task = task_queue->dequeue();
        EXPECT_FALSE(static_cast<bool>(task));
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    task_queue->shutdown();
    consumer.join();
    EXPECT_TRUE(returned.load());
}

TEST_F(TaskQueueTest, FutureCarriesResult) {
    auto future = task_queue->enqueueWithFuture([]() { return 42; });
    task_queue->dequeue()();
    EXPECT_EQ(future.get(), 42);
}

TEST_F(TaskQueueTest, FutureCarriesException) {
    auto future = task_queue->enqueueWithFuture([]() -> int { throw std::runtime_error("boom"); });
    task_queue->dequeue()();
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(TaskQueueTest, RejectedFutureIsBroken) {
    task_queue->shutdown();
    auto future = task_queue->enqueueWithFuture([]() { return 1; });
    EXPECT_THROW(future.get(), std::future_error);
}

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        task_queue = std::make_shared<TaskQueue>();
        thread_pool = std::make_unique<ThreadPool>(4);
    }

    void TearDown() override {
        thread_pool->stop();
    }

    std::shared_ptr<TaskQueue> task_queue;
    std::unique_ptr<ThreadPool> thread_pool;
};

TEST_F(ThreadPoolTest, StartAndStop) {
    EXPECT_EQ(thread_pool->getNumThreads(), 4u);
    EXPECT_FALSE(thread_pool->isRunning());

    thread_pool->start(task_queue);
    EXPECT_TRUE(thread_pool->isRunning());

    thread_pool->stop();
    EXPECT_FALSE(thread_pool->isRunning());
    EXPECT_EQ(thread_pool->getActiveThreads(), 0u);
}

TEST_F(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.getNumThreads(), 1u);
}

TEST_F(ThreadPoolTest, RunsEveryTask) {
    std::atomic<int> counter{0};
    std::vector<std::future<int>> futures;

    thread_pool->start(task_queue);
    for (int i = 0; i < 50; ++i) {
        futures.push_back(task_queue->enqueueWithFuture([&counter, i]() {
            counter++;
            return i * 2;
        }));
    }

    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(futures[i].get(), i * 2);
    }
    EXPECT_EQ(counter.load(), 50);
}

// stop() only returns once queued work has run
TEST_F(ThreadPoolTest, StopDrainsQueue) {
    std::atomic<int> counter{0};
    thread_pool->start(task_queue);

    for (int i = 0; i < 20; ++i) {
        task_queue->enqueue([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            counter++;
        });
    }

    thread_pool->stop();
    EXPECT_EQ(counter.load(), 20);
}

TEST_F(ThreadPoolTest, FailingTaskDoesNotKillWorker) {
    thread_pool = std::make_unique<ThreadPool>(1);
    thread_pool->start(task_queue);

    task_queue->enqueue([]() { throw std::runtime_error("task failure"); });
    auto future = task_queue->enqueueWithFuture([]() { return 7; });

    EXPECT_EQ(future.get(), 7);
}
