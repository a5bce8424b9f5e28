// DIRGATE - Thread Pool
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Worker pool used by the RPC server to serve connections, and a
// scheduler for periodic maintenance such as rate-limit sweeps.

#ifndef DIRGATE_UTIL_THREADPOOL_H
#define DIRGATE_UTIL_THREADPOOL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace dirgate {
namespace util {

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * Fixed-size pool of worker threads consuming a FIFO queue.
 *
 * Exceptions escaping a task submitted with Execute are logged; those from
 * Submit are delivered through the returned future.
 */
class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{10000};  // Maximum pending tasks
        std::string name{"pool"};    // Used in log messages
        bool startImmediately{true};
    };

    ThreadPool();
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);

    /// Finishes queued tasks, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Start();

    /// Block until the queue is empty and no task is executing
    void Wait();

    /// Stop accepting tasks, drain the queue and join the workers
    void Shutdown();

    bool IsRunning() const { return running_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    size_t ActiveTasks() const { return activeTasks_.load(); }
    const std::string& Name() const { return config_.name; }

    // ========================================================================
    // Task Submission
    // ========================================================================

    /**
     * Submit a task and receive its result through a future.
     * @throws std::runtime_error if the pool is stopped or the queue is full
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using ReturnType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<ReturnType> result = task->get_future();

        Enqueue([task]() { (*task)(); });
        return result;
    }

    /// Fire-and-forget submission; throws like Submit
    template<typename F, typename... Args>
    void Execute(F&& f, Args&&... args) {
        Enqueue(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    }

    /// Returns false instead of throwing when the task cannot be queued
    template<typename F, typename... Args>
    bool TrySubmit(F&& f, Args&&... args) {
        std::function<void()> func = std::bind(std::forward<F>(f), std::forward<Args>(args)...);
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load() || tasks_.size() >= config_.maxQueueSize) {
                return false;
            }
            tasks_.push_back(std::move(func));
        }
        condition_.notify_one();
        return true;
    }

private:
    void Enqueue(std::function<void()> func);
    void WorkerLoop();

    Config config_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable waitCondition_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> activeTasks_{0};
};

// ============================================================================
// Scheduler
// ============================================================================

/**
 * Runs delayed and periodic tasks on a ThreadPool.
 * Periodic tasks are rescheduled relative to when they were dispatched.
 */
class Scheduler {
public:
    explicit Scheduler(ThreadPool& pool);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void Start();

    /// Stop the timer thread and drop all scheduled tasks
    void Stop();

    bool IsRunning() const { return running_.load(); }

    /// @return Task ID for cancellation
    uint64_t ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> func);

    /**
     * Schedule a repeating task.
     * @param initialDelay Delay before first execution
     * @param period Time between executions (must be positive)
     */
    uint64_t SchedulePeriodic(std::chrono::milliseconds initialDelay,
                              std::chrono::milliseconds period,
                              std::function<void()> func);

    bool Cancel(uint64_t taskId);
    void CancelAll();
    size_t TaskCount() const;

private:
    struct ScheduledTask {
        uint64_t id{0};
        std::chrono::steady_clock::time_point nextRun;
        std::chrono::milliseconds period{0};
        std::function<void()> task;

        bool operator>(const ScheduledTask& other) const {
            return nextRun > other.nextRun;
        }
    };

    uint64_t ScheduleTask(std::chrono::steady_clock::time_point time,
                          std::chrono::milliseconds period,
                          std::function<void()> func);
    void SchedulerLoop();

    ThreadPool& pool_;
    std::thread schedulerThread_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<ScheduledTask, std::vector<ScheduledTask>,
                        std::greater<ScheduledTask>> tasks_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> nextId_{1};
};

} // namespace util
} // namespace dirgate

#endif // DIRGATE_UTIL_THREADPOOL_H
