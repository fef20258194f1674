/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ThreadSystemTests
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <vector>

#include "core/ThreadSystem.hpp"
#include "core/WorkerBudget.hpp"

using namespace GlyphFlow;

namespace {
constexpr unsigned int TEST_WORKERS = 4;
}

// Global fixture for test setup and cleanup
struct ThreadTestFixture {
    ThreadTestFixture() {
        ThreadSystem::Instance().init(4096, TEST_WORKERS);
        WorkerBudgetManager::Instance().invalidateCache();
    }

    ~ThreadTestFixture() {
        ThreadSystem::Instance().clean();
    }
};

BOOST_GLOBAL_FIXTURE(ThreadTestFixture);

BOOST_AUTO_TEST_SUITE(ThreadSystemTaskTests)

BOOST_AUTO_TEST_CASE(TestThreadPoolInitialization) {
    BOOST_CHECK(ThreadSystem::Exists());
    BOOST_CHECK(!ThreadSystem::Instance().isShutdown());
    BOOST_CHECK_EQUAL(ThreadSystem::Instance().getThreadCount(), TEST_WORKERS);
    BOOST_CHECK_EQUAL(ThreadSystem::Instance().getQueueCapacity(), 4096);

    // A second init is a no-op that still reports success
    BOOST_CHECK(ThreadSystem::Instance().init());
    BOOST_CHECK_EQUAL(ThreadSystem::Instance().getThreadCount(), TEST_WORKERS);
}

BOOST_AUTO_TEST_CASE(TestTaskWithResult) {
    auto future = ThreadSystem::Instance().enqueueTaskWithResult([]() -> int {
        return 42;
    });
    BOOST_CHECK_EQUAL(future.get(), 42);
}

BOOST_AUTO_TEST_CASE(TestTaskPriorities) {
    std::atomic<int> tasksCompleted{0};
    std::vector<std::future<void>> futures;

    for (TaskPriority priority : {TaskPriority::Low, TaskPriority::Normal,
                                  TaskPriority::High, TaskPriority::Critical,
                                  TaskPriority::Idle}) {
        futures.push_back(ThreadSystem::Instance().enqueueTaskWithResult(
            [&tasksCompleted]() { tasksCompleted.fetch_add(1); },
            priority, "Priority task"));
    }

    for (auto& future : futures) {
        future.get();
    }
    BOOST_CHECK_EQUAL(tasksCompleted.load(), 5);
}

BOOST_AUTO_TEST_CASE(TestConcurrentTaskResults) {
    const int numTasks = 50;
    std::vector<std::future<int>> futures;

    for (int i = 0; i < numTasks; ++i) {
        futures.push_back(ThreadSystem::Instance().enqueueTaskWithResult(
            [i]() -> int {
                std::this_thread::sleep_for(std::chrono::milliseconds(i % 5));
                return i;
            },
            TaskPriority::Normal,
            "Return index task " + std::to_string(i)));
    }

    std::unordered_set<int> results;
    for (auto& future : futures) {
        results.insert(future.get());
    }

    BOOST_CHECK_EQUAL(results.size(), static_cast<size_t>(numTasks));
    for (int i = 0; i < numTasks; ++i) {
        BOOST_CHECK(results.find(i) != results.end());
    }
}

BOOST_AUTO_TEST_CASE(TestTasksWithExceptions) {
    auto future = ThreadSystem::Instance().enqueueTaskWithResult(
        []() -> int {
            throw std::runtime_error("Test exception");
        },
        TaskPriority::Normal, "Exception-throwing task");

    BOOST_CHECK_THROW(future.get(), std::runtime_error);

    // The worker survives the exception
    auto next = ThreadSystem::Instance().enqueueTaskWithResult([]() -> int { return 7; });
    BOOST_CHECK_EQUAL(next.get(), 7);
}

BOOST_AUTO_TEST_CASE(TestBatchEnqueue) {
    const int numTasks = 64;
    std::atomic<int> counter{0};
    std::mutex doneMutex;
    std::condition_variable doneCv;

    std::vector<std::function<void()>> tasks;
    for (int i = 0; i < numTasks; ++i) {
        tasks.push_back([&]() {
            if (counter.fetch_add(1) + 1 == numTasks) {
                std::lock_guard<std::mutex> lock(doneMutex);
                doneCv.notify_one();
            }
        });
    }
    ThreadSystem::Instance().batchEnqueueTasks(tasks, TaskPriority::High, "Batch task");

    std::unique_lock<std::mutex> lock(doneMutex);
    const bool finished = doneCv.wait_for(lock, std::chrono::seconds(5), [&]() {
        return counter.load() == numTasks;
    });
    BOOST_CHECK(finished);
    BOOST_CHECK_EQUAL(counter.load(), numTasks);
}

BOOST_AUTO_TEST_CASE(TestLoadBalancing) {
    const int numTasks = 200;
    std::vector<size_t> threadIds(numTasks);
    std::mutex idMutex;

    std::vector<std::future<void>> futures;
    for (int i = 0; i < numTasks; ++i) {
        futures.push_back(ThreadSystem::Instance().enqueueTaskWithResult(
            [i, &threadIds, &idMutex]() -> void {
                const size_t threadId = std::hash<std::thread::id>{}(std::this_thread::get_id());
                {
                    std::lock_guard<std::mutex> lock(idMutex);
                    threadIds[i] = threadId;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            },
            TaskPriority::Normal, "Thread ID recording task"));
    }

    for (auto& future : futures) {
        future.wait();
    }

    std::unordered_set<size_t> uniqueThreads(threadIds.begin(), threadIds.end());
    BOOST_CHECK_GE(uniqueThreads.size(), 2u);
    std::cout << "Tasks were executed on " << uniqueThreads.size() << " different threads." << std::endl;
}

BOOST_AUTO_TEST_CASE(TestTaskStats) {
    const int numTasks = 50;
    const size_t initialEnqueued = ThreadSystem::Instance().getTotalTasksEnqueued();

    std::vector<std::future<void>> futures;
    for (int i = 0; i < numTasks; ++i) {
        futures.push_back(ThreadSystem::Instance().enqueueTaskWithResult(
            []() -> void {}, TaskPriority::Normal, "Stats test task"));
    }
    for (auto& future : futures) {
        future.wait();
    }

    BOOST_CHECK_GE(ThreadSystem::Instance().getTotalTasksEnqueued(),
                   initialEnqueued + numTasks);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(WorkerBudgetTests)

BOOST_AUTO_TEST_CASE(TestOptimalWorkers) {
    auto& budget = WorkerBudgetManager::Instance();
    budget.invalidateCache();

    BOOST_CHECK_EQUAL(budget.getOptimalWorkers(SystemType::Particle, 0), 0u);
    BOOST_CHECK_EQUAL(budget.getOptimalWorkers(SystemType::Particle, 100000), TEST_WORKERS);
    BOOST_CHECK_EQUAL(budget.getBudget().totalWorkers, TEST_WORKERS);
}

BOOST_AUTO_TEST_CASE(TestBatchStrategyCoversWorkload) {
    auto& budget = WorkerBudgetManager::Instance();

    for (size_t workload : {size_t{1}, size_t{7}, size_t{64}, size_t{4099}, size_t{1000000}}) {
        const auto [batchCount, batchSize] =
            budget.getBatchStrategy(SystemType::Particle, workload, TEST_WORKERS);
        BOOST_CHECK_GE(batchCount, 1u);
        BOOST_CHECK_GE(batchCount * batchSize, workload);
        // No batch below the minimum unless the whole workload is smaller
        if (workload >= 8) {
            BOOST_CHECK_GE(batchSize, 8u);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestMultiplierAdaptsToBatchTiming) {
    auto& budget = WorkerBudgetManager::Instance();
    const float start = budget.getBatchMultiplier(SystemType::Particle);

    // 10 ms per batch is slow, so batches grow in count
    budget.reportBatchCompletion(SystemType::Particle, 4, 40.0);
    const float afterSlow = budget.getBatchMultiplier(SystemType::Particle);
    BOOST_CHECK_GT(afterSlow, start);

    // Tiny batches shrink the count again
    budget.reportBatchCompletion(SystemType::Particle, 4, 0.01);
    BOOST_CHECK_LT(budget.getBatchMultiplier(SystemType::Particle), afterSlow);

    // Clamped
    for (int i = 0; i < 500; ++i) {
        budget.reportBatchCompletion(SystemType::Particle, 1, 100.0);
    }
    BOOST_CHECK_LE(budget.getBatchMultiplier(SystemType::Particle), 2.0f);

    // Zero batches are ignored
    const float before = budget.getBatchMultiplier(SystemType::Particle);
    budget.reportBatchCompletion(SystemType::Particle, 0, 100.0);
    BOOST_CHECK_EQUAL(budget.getBatchMultiplier(SystemType::Particle), before);
}

BOOST_AUTO_TEST_SUITE_END()

// Runs last: the pool cannot be restarted after clean()
BOOST_AUTO_TEST_SUITE(ThreadSystemShutdownTests)

BOOST_AUTO_TEST_CASE(TestResultAfterShutdownIsReady) {
    ThreadSystem::Instance().clean();
    BOOST_CHECK(!ThreadSystem::Exists());
    BOOST_CHECK(!ThreadSystem::Instance().init());

    auto future = ThreadSystem::Instance().enqueueTaskWithResult([]() -> int { return 99; });
    BOOST_CHECK(future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    BOOST_CHECK_EQUAL(future.get(), 0);

    auto voidFuture = ThreadSystem::Instance().enqueueTaskWithResult([]() {});
    BOOST_CHECK(voidFuture.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
}

BOOST_AUTO_TEST_SUITE_END()
