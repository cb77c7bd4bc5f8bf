#include "common/scheduler.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <sstream>
#include <vector>

Scheduler::Scheduler()
    : running_(false) {
}

Scheduler::~Scheduler() {
    stop();
}

bool Scheduler::scheduleTask(const std::string& taskId,
                             TimePoint scheduledTime,
                             TaskCallback callback) {
    if (!callback) {
        return false;
    }
    std::unique_lock<std::mutex> lock(tasksMutex_);
    tasks_[taskId] = {scheduledTime, Duration(0), std::move(callback), false};
    condition_.notify_one();
    return true;
}

bool Scheduler::schedulePeriodicTask(const std::string& taskId,
                                     Duration interval,
                                     TaskCallback callback,
                                     bool runImmediately) {
    if (!callback || interval.count() <= 0) {
        return false;
    }
    std::unique_lock<std::mutex> lock(tasksMutex_);
    auto now = Clock::now();
    tasks_[taskId] = {runImmediately ? now : now + interval, interval, std::move(callback), true};
    condition_.notify_one();
    return true;
}

bool Scheduler::cancelTask(const std::string& taskId) {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    return tasks_.erase(taskId) > 0;
}

bool Scheduler::hasTask(const std::string& taskId) const {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    return tasks_.count(taskId) > 0;
}

void Scheduler::start() {
    if (!running_) {
        running_ = true;
        schedulerThread_ = std::thread(&Scheduler::schedulerLoop, this);
    }
}

void Scheduler::stop() {
    {
        std::unique_lock<std::mutex> lock(tasksMutex_);
        running_ = false;
    }
    condition_.notify_all();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
}

void Scheduler::processTasks() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    auto now = Clock::now();

    std::vector<std::pair<std::string, Task>> due;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second.scheduledTime <= now) {
            due.emplace_back(it->first, it->second);
            if (it->second.isPeriodic) {
                it->second.scheduledTime = now + it->second.interval;
                ++it;
            } else {
                it = tasks_.erase(it);
            }
        } else {
            ++it;
        }
    }
    lock.unlock();

    for (const auto& item : due) {
        executeTask(item.first, item.second);
    }
}

void Scheduler::executeTask(const std::string& taskId, const Task& task) {
    try {
        task.callback();
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Task " << taskId << " failed: " << e.what();
        Logger::error(ss.str());
    }
}

void Scheduler::schedulerLoop() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    while (running_) {
        if (tasks_.empty()) {
            condition_.wait(lock, [this] {
                return !running_ || !tasks_.empty();
            });
            continue;
        }

        auto now = Clock::now();
        auto nextTask = std::min_element(tasks_.begin(), tasks_.end(),
            [](const auto& a, const auto& b) {
                return a.second.scheduledTime < b.second.scheduledTime;
            });

        if (nextTask->second.scheduledTime <= now) {
            auto taskId = nextTask->first;
            auto task = nextTask->second;

            if (task.isPeriodic) {
                nextTask->second.scheduledTime = now + task.interval;
            } else {
                tasks_.erase(nextTask);
            }

            lock.unlock();
            executeTask(taskId, task);
            lock.lock();
        } else {
            condition_.wait_until(lock, nextTask->second.scheduledTime);
        }
    }
}
