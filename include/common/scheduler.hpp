#pragma once

#include <string>
#include <functional>
#include <mutex>
#include <map>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <thread>
#include "common/logger.hpp"

// Runs one-shot and periodic callbacks on a single background thread.
class Scheduler {
public:
    using TaskCallback = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::seconds;

    Scheduler();
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Schedule a task to run at a specific time
    bool scheduleTask(const std::string& taskId,
                      TimePoint scheduledTime,
                      TaskCallback callback);

    // Schedule a task to run every interval; the first run is one interval away
    // unless runImmediately is set.
    bool schedulePeriodicTask(const std::string& taskId,
                              Duration interval,
                              TaskCallback callback,
                              bool runImmediately = false);

    bool cancelTask(const std::string& taskId);
    bool hasTask(const std::string& taskId) const;

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Runs every task that is due now on the calling thread. Used when no
    // background thread is wanted.
    void processTasks();

private:
    struct Task {
        TimePoint scheduledTime;
        Duration interval;
        TaskCallback callback;
        bool isPeriodic;
    };

    void executeTask(const std::string& taskId, const Task& task);
    void schedulerLoop();

    std::map<std::string, Task> tasks_;
    mutable std::mutex tasksMutex_;
    std::condition_variable condition_;
    std::atomic<bool> running_;
    std::thread schedulerThread_;
};
