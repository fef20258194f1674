/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: worker pool and prioritized task queue used to run the
 * particle force kernel as a parallel-for
 */

#ifndef THREAD_SYSTEM_HPP
#define THREAD_SYSTEM_HPP

#include "Logger.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

// Platform-specific includes for thread naming
#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace GlyphFlow {

// Task priority levels
enum class TaskPriority {
  Critical = 0, // Must execute ASAP
  High = 1,     // Frame-critical work (kernel batches when latency matters)
  Normal = 2,   // Default priority for most tasks
  Low = 3,      // Background tasks (font loading, warmup)
  Idle = 4      // Only execute when nothing else is pending
};

constexpr size_t TASK_PRIORITY_COUNT = 5;

// Task wrapper with priority information
struct PrioritizedTask {
  std::function<void()> task;
  TaskPriority priority{TaskPriority::Normal};
  std::chrono::steady_clock::time_point enqueueTime{
      std::chrono::steady_clock::now()};
  std::string description;

  PrioritizedTask() = default;

  PrioritizedTask(std::function<void()> t, TaskPriority p,
                  std::string desc = "")
      : task(std::move(t)), priority(p), description(std::move(desc)) {}
};

/**
 * @brief Thread-safe prioritized task queue
 *
 * One deque per priority level behind a single mutex. Workers always drain
 * the highest non-empty priority first; within a level tasks run FIFO.
 */
class TaskQueue {
public:
  explicit TaskQueue(size_t initialCapacity = 256)
      : m_desiredCapacity(initialCapacity) {}

  void push(std::function<void()> task,
            TaskPriority priority = TaskPriority::Normal,
            const std::string &description = "") {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_queues[static_cast<size_t>(priority)].emplace_back(
          std::move(task), priority, description);
      ++m_size;
    }
    m_totalEnqueued.fetch_add(1, std::memory_order_relaxed);
    m_condition.notify_one();
  }

  /**
   * @brief Push a batch under one lock acquisition
   * @param tasks Tasks to enqueue (moved from, left empty)
   */
  void batchPush(std::vector<std::function<void()>> &tasks,
                 TaskPriority priority = TaskPriority::Normal,
                 const std::string &description = "") {
    if (tasks.empty()) {
      return;
    }
    const size_t count = tasks.size();
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      auto &queue = m_queues[static_cast<size_t>(priority)];
      for (auto &task : tasks) {
        queue.emplace_back(std::move(task), priority, description);
      }
      m_size += count;
    }
    tasks.clear();
    m_totalEnqueued.fetch_add(count, std::memory_order_relaxed);
    if (count == 1) {
      m_condition.notify_one();
    } else {
      m_condition.notify_all();
    }
  }

  // Blocks until a task is available or the queue is stopped
  bool pop(std::function<void()> &task) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait(lock, [this] {
      return m_stopping.load(std::memory_order_acquire) || m_size > 0;
    });

    if (m_stopping.load(std::memory_order_acquire)) {
      return false;
    }

    for (auto &queue : m_queues) {
      if (!queue.empty()) {
        task = std::move(queue.front().task);
        queue.pop_front();
        --m_size;
        return true;
      }
    }
    return false;
  }

  void stop() {
    m_stopping.store(true, std::memory_order_release);
    m_condition.notify_all();
  }

  bool isEmpty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_size == 0;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_size;
  }

  void reserve(size_t capacity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (capacity > m_desiredCapacity) {
      m_desiredCapacity = capacity;
    }
  }

  size_t capacity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_desiredCapacity;
  }

  size_t getTotalTasksEnqueued() const {
    return m_totalEnqueued.load(std::memory_order_relaxed);
  }

private:
  std::array<std::deque<PrioritizedTask>, TASK_PRIORITY_COUNT> m_queues{};
  mutable std::mutex m_mutex;
  std::condition_variable m_condition;
  std::atomic<bool> m_stopping{false};
  size_t m_size{0};
  size_t m_desiredCapacity;
  std::atomic<size_t> m_totalEnqueued{0};
};

// Fixed-size pool of worker threads draining one TaskQueue
class ThreadPool {
public:
  explicit ThreadPool(size_t numThreads, size_t queueCapacity = 256)
      : m_taskQueue(queueCapacity) {
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      m_workers.emplace_back([this, i] {
#if defined(__linux__) || defined(_GNU_SOURCE)
        std::string threadName = std::format("Worker-{}", i);
        pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
        std::string threadName = std::format("Worker-{}", i);
        pthread_setname_np(threadName.c_str());
#endif
        workerThread();
      });
    }
  }

  ~ThreadPool() {
    m_isRunning.store(false, std::memory_order_release);
    m_taskQueue.stop();

    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    THREADSYSTEM_INFO("ThreadPool shutdown completed");
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void enqueue(std::function<void()> task,
               TaskPriority priority = TaskPriority::Normal,
               const std::string &description = "") {
    m_taskQueue.push(std::move(task), priority, description);
  }

  void batchEnqueue(std::vector<std::function<void()>> &tasks,
                    TaskPriority priority = TaskPriority::Normal,
                    const std::string &description = "") {
    m_taskQueue.batchPush(tasks, priority, description);
  }

  template <class F, class... Args>
  auto enqueueWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                         const std::string &description = "", Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));

    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority, description);
    return result;
  }

  bool busy() const {
    return !m_taskQueue.isEmpty() ||
           m_activeTasks.load(std::memory_order_relaxed) > 0;
  }

  TaskQueue &getTaskQueue() { return m_taskQueue; }
  const TaskQueue &getTaskQueue() const { return m_taskQueue; }

  size_t getTotalTasksProcessed() const {
    return m_totalTasksProcessed.load(std::memory_order_relaxed);
  }

private:
  void workerThread() {
    std::function<void()> task;
    while (m_isRunning.load(std::memory_order_acquire)) {
      if (!m_taskQueue.pop(task)) {
        continue;
      }

      m_activeTasks.fetch_add(1, std::memory_order_relaxed);
      try {
        task();
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR(std::format("Exception in worker task: {}", e.what()));
      }
      m_activeTasks.fetch_sub(1, std::memory_order_relaxed);
      m_totalTasksProcessed.fetch_add(1, std::memory_order_relaxed);
      task = nullptr;
    }
  }

  std::vector<std::thread> m_workers;
  TaskQueue m_taskQueue;
  std::atomic<bool> m_isRunning{true};
  std::atomic<size_t> m_activeTasks{0};
  std::atomic<size_t> m_totalTasksProcessed{0};
};

/**
 * @brief Process-wide worker pool
 *
 * init() once at startup, clean() once at shutdown. A cleaned ThreadSystem
 * cannot be re-initialized; callers check Exists() and fall back to running
 * work inline.
 */
class ThreadSystem {
public:
  static constexpr size_t DEFAULT_QUEUE_CAPACITY = 4096;

  static ThreadSystem &Instance() {
    static ThreadSystem instance;
    return instance;
  }

  /**
   * @brief True while a worker pool is running
   */
  static bool Exists() {
    const ThreadSystem &instance = Instance();
    return !instance.m_isShutdown.load(std::memory_order_acquire) &&
           instance.m_isInitialized.load(std::memory_order_acquire);
  }

  /**
   * @brief Start the worker pool
   *
   * @param queueCapacity Initial task queue capacity
   * @param customThreadCount Exact worker count, 0 for hardware_concurrency - 1
   * @return true if the pool is running (including when already initialized)
   */
  bool init(size_t queueCapacity = DEFAULT_QUEUE_CAPACITY,
            unsigned int customThreadCount = 0) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShutdown.load(std::memory_order_acquire)) {
      THREADSYSTEM_WARN("ThreadSystem already shut down, ignoring init request");
      return false;
    }
    if (m_threadPool) {
      return true;
    }

    m_queueCapacity = queueCapacity;
    if (customThreadCount > 0) {
      m_numThreads = customThreadCount;
    } else {
      // Keep one core for the thread driving update()
      const unsigned int hardwareThreads = std::thread::hardware_concurrency();
      m_numThreads = (hardwareThreads > 1) ? (hardwareThreads - 1) : 1;
    }

    try {
      m_threadPool = std::make_unique<ThreadPool>(m_numThreads, m_queueCapacity);
    } catch (const std::exception &e) {
      THREADSYSTEM_ERROR(std::format("Failed to initialize ThreadSystem: {}",
                                     e.what()));
      return false;
    }

    m_isInitialized.store(true, std::memory_order_release);
    THREADSYSTEM_INFO(std::format("ThreadSystem initialized with {} worker threads",
                                  m_numThreads));
    return true;
  }

  void clean() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShutdown.exchange(true, std::memory_order_acq_rel)) {
      return;
    }

    if (m_threadPool) {
      const size_t pendingTasks = m_threadPool->getTaskQueue().size();
      if (pendingTasks > 0) {
        THREADSYSTEM_INFO(std::format("Canceling {} pending tasks during shutdown",
                                      pendingTasks));
      }
      m_threadPool.reset();
    }
    m_isInitialized.store(false, std::memory_order_release);
    THREADSYSTEM_INFO("ThreadSystem resources cleaned!");
  }

  ~ThreadSystem() { clean(); }

  void enqueueTask(std::function<void()> task,
                   TaskPriority priority = TaskPriority::Normal,
                   const std::string &description = "") {
    if (!Exists() || !m_threadPool) {
      THREADSYSTEM_DEBUG("Ignoring task, no worker pool" +
                         (description.empty() ? "" : " (" + description + ")"));
      return;
    }
    m_threadPool->enqueue(std::move(task), priority, description);
  }

  /**
   * @brief Enqueue many tasks under one queue lock
   *
   * @param tasks Tasks to enqueue (moved from)
   */
  void batchEnqueueTasks(std::vector<std::function<void()>> &tasks,
                         TaskPriority priority = TaskPriority::Normal,
                         const std::string &description = "") {
    if (!Exists() || !m_threadPool || tasks.empty()) {
      return;
    }
    m_threadPool->batchEnqueue(tasks, priority, description);
  }

  /**
   * @brief Enqueue a task and get a future for its result
   *
   * Without a running pool the returned future is already satisfied with a
   * default-constructed value, so callers waiting on it never block.
   */
  template <class F, class... Args>
  auto enqueueTaskWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                             const std::string &description = "",
                             Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type> {
    using ResultType = typename std::invoke_result<F, Args...>::type;

    if (!Exists() || !m_threadPool) {
      std::promise<ResultType> promise;
      if constexpr (std::is_void_v<ResultType>) {
        promise.set_value();
      } else if constexpr (std::is_default_constructible_v<ResultType>) {
        promise.set_value(ResultType{});
      } else {
        promise.set_exception(std::make_exception_ptr(std::runtime_error(
            "ThreadSystem not running: cannot create default value")));
      }
      return promise.get_future();
    }

    return m_threadPool->enqueueWithResult(std::forward<F>(f), priority,
                                           description,
                                           std::forward<Args>(args)...);
  }

  bool isBusy() const {
    return Exists() && m_threadPool && m_threadPool->busy();
  }

  unsigned int getThreadCount() const { return m_numThreads; }

  bool isShutdown() const {
    return m_isShutdown.load(std::memory_order_acquire);
  }

  size_t getQueueCapacity() const {
    return m_threadPool ? m_threadPool->getTaskQueue().capacity()
                        : m_queueCapacity;
  }

  size_t getQueueSize() const {
    return m_threadPool ? m_threadPool->getTaskQueue().size() : 0;
  }

  size_t getTotalTasksProcessed() const {
    return m_threadPool ? m_threadPool->getTotalTasksProcessed() : 0;
  }

  size_t getTotalTasksEnqueued() const {
    return m_threadPool ? m_threadPool->getTaskQueue().getTotalTasksEnqueued()
                        : 0;
  }

private:
  std::unique_ptr<ThreadPool> m_threadPool{nullptr};
  unsigned int m_numThreads{0};
  size_t m_queueCapacity{DEFAULT_QUEUE_CAPACITY};
  std::atomic<bool> m_isShutdown{false};
  std::atomic<bool> m_isInitialized{false};
  mutable std::mutex m_mutex{};

  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;

  ThreadSystem() = default;
};

} // namespace GlyphFlow

#endif // THREAD_SYSTEM_HPP
