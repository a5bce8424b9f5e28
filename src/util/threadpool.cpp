// DIRGATE - Thread Pool Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/util/threadpool.h"

#include "dirgate/util/logging.h"

namespace dirgate {
namespace util {

// ============================================================================
// ThreadPool
// ============================================================================

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(size_t numThreads) : ThreadPool(Config{numThreads}) {}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    if (config_.startImmediately) {
        Start();
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Start() {
    if (running_.exchange(true)) {
        return;
    }

    size_t numThreads = config_.numThreads;
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 2;
        }
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }

    LOG_DEBUG(LogCategory::DEFAULT) << "Thread pool '" << config_.name << "' started with "
                                    << numThreads << " workers";
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    waitCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_.load() == 0;
    });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

void ThreadPool::Enqueue(std::function<void()> func) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            throw std::runtime_error("ThreadPool '" + config_.name + "' not running");
        }
        if (tasks_.size() >= config_.maxQueueSize) {
            throw std::runtime_error("ThreadPool '" + config_.name + "' queue full");
        }
        tasks_.push_back(std::move(func));
    }
    condition_.notify_one();
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });

            // Queued work is drained before exiting
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            activeTasks_.fetch_add(1);
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::DEFAULT) << "Task in pool '" << config_.name
                                            << "' threw: " << e.what();
        } catch (...) {
            LOG_ERROR(LogCategory::DEFAULT) << "Task in pool '" << config_.name
                                            << "' threw a non-standard exception";
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            activeTasks_.fetch_sub(1);
        }
        waitCondition_.notify_all();
    }
}

// ============================================================================
// Scheduler
// ============================================================================

Scheduler::Scheduler(ThreadPool& pool) : pool_(pool) {}

Scheduler::~Scheduler() {
    Stop();
}

void Scheduler::Start() {
    if (running_.exchange(true)) {
        return;
    }
    schedulerThread_ = std::thread(&Scheduler::SchedulerLoop, this);
}

void Scheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    condition_.notify_all();

    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
    CancelAll();
}

uint64_t Scheduler::ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> func) {
    return ScheduleTask(std::chrono::steady_clock::now() + delay,
                        std::chrono::milliseconds(0), std::move(func));
}

uint64_t Scheduler::SchedulePeriodic(std::chrono::milliseconds initialDelay,
                                     std::chrono::milliseconds period,
                                     std::function<void()> func) {
    if (period.count() <= 0) {
        throw std::invalid_argument("Scheduler period must be positive");
    }
    return ScheduleTask(std::chrono::steady_clock::now() + initialDelay,
                        period, std::move(func));
}

bool Scheduler::Cancel(uint64_t taskId) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ScheduledTask> remaining;
    bool found = false;
    while (!tasks_.empty()) {
        ScheduledTask task = tasks_.top();
        tasks_.pop();
        if (task.id == taskId) {
            found = true;
        } else {
            remaining.push_back(std::move(task));
        }
    }
    for (auto& task : remaining) {
        tasks_.push(std::move(task));
    }
    return found;
}

void Scheduler::CancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!tasks_.empty()) {
        tasks_.pop();
    }
}

size_t Scheduler::TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

uint64_t Scheduler::ScheduleTask(std::chrono::steady_clock::time_point time,
                                 std::chrono::milliseconds period,
                                 std::function<void()> func) {
    ScheduledTask task;
    task.id = nextId_.fetch_add(1);
    task.nextRun = time;
    task.period = period;
    task.task = std::move(func);

    uint64_t id = task.id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
    return id;
}

void Scheduler::SchedulerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_.load()) {
        if (tasks_.empty()) {
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        if (tasks_.top().nextRun > now) {
            condition_.wait_until(lock, tasks_.top().nextRun);
            continue;
        }

        ScheduledTask task = tasks_.top();
        tasks_.pop();

        if (!pool_.TrySubmit(task.task)) {
            LOG_WARN(LogCategory::DEFAULT) << "Scheduled task " << task.id
                                           << " dropped: pool '" << pool_.Name()
                                           << "' unavailable";
        }

        if (task.period.count() > 0) {
            task.nextRun = now + task.period;
            tasks_.push(std::move(task));
        }
    }
}

} // namespace util
} // namespace dirgate
