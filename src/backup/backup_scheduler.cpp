#include "backup/backup_scheduler.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <algorithm>

BackupScheduler::BackupScheduler(PlanRepository& plans, JobManager& jobManager,
                                 std::chrono::seconds tickInterval, Clock clock)
    : plans_(plans)
    , jobManager_(jobManager)
    , tickInterval_(tickInterval)
    , clock_(std::move(clock))
    , running_(false)
    , stopRequested_(false) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

BackupScheduler::~BackupScheduler() {
    stop();
}

BackupScheduler::ScheduleEntry BackupScheduler::makeEntry(const BackupPlan& plan) {
    ScheduleEntry entry;
    entry.plan = plan;
    try {
        entry.cron = CronExpression::parse(plan.schedule);
    } catch (const ConfigurationError& e) {
        Logger::error("Plan '" + plan.name + "' has an invalid schedule and will not run: " + e.what());
    }
    return entry;
}

BackupScheduler::ReconcileResult BackupScheduler::reconcile() {
    std::vector<BackupPlan> active;
    for (auto& plan : plans_.listPlans()) {
        if (plan.active) {
            active.push_back(std::move(plan));
        }
    }

    ReconcileResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto it = schedules_.begin(); it != schedules_.end();) {
            bool stillActive = std::any_of(active.begin(), active.end(),
                                           [&](const BackupPlan& plan) { return plan.id == it->first; });
            if (!stillActive) {
                result.removed.push_back(it->first);
                it = schedules_.erase(it);
            } else {
                ++it;
            }
        }

        for (const auto& plan : active) {
            auto it = schedules_.find(plan.id);
            if (it == schedules_.end()) {
                schedules_.emplace(plan.id, makeEntry(plan));
                result.added.push_back(plan.id);
            } else if (it->second.plan != plan) {
                it->second = makeEntry(plan);
                result.changed.push_back(plan.id);
            }
        }
    }

    for (const auto& planId : result.removed) {
        Logger::info("Plan " + planId + " removed from schedule");
        if (jobManager_.cancelPlan(planId)) {
            Logger::info("Cancelled in-flight run of plan " + planId);
        }
    }
    for (const auto& planId : result.added) {
        Logger::info("Plan " + planId + " added to schedule");
    }
    for (const auto& planId : result.changed) {
        Logger::info("Plan " + planId + " schedule updated");
    }
    return result;
}

bool BackupScheduler::isDue(const CronExpression& cron, utils::TimePoint now) {
    auto next = cron.next(now - std::chrono::minutes(1));
    return next && *next <= now && now - *next < std::chrono::minutes(1);
}

std::vector<std::string> BackupScheduler::tick(utils::TimePoint now) {
    std::lock_guard<std::mutex> tickLock(tickMutex_);
    std::vector<std::string> dispatched;

    jobManager_.cleanupCompletedJobs();

    try {
        reconcile();
    } catch (const std::exception& e) {
        Logger::error("Cannot load backup plans, skipping this tick: " + std::string(e.what()));
        return dispatched;
    }

    std::vector<BackupPlan> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : schedules_) {
            const auto& entry = pair.second;
            if (!entry.cron) {
                Logger::debug("Skipping plan '" + entry.plan.name + "': invalid schedule");
                continue;
            }
            if (isDue(*entry.cron, now)) {
                due.push_back(entry.plan);
            }
        }
    }

    for (const auto& plan : due) {
        if (jobManager_.isPlanRunning(plan.id)) {
            Logger::warning("Plan '" + plan.name + "' is due but its previous run is still in flight");
            continue;
        }
        Logger::info("Plan '" + plan.name + "' is due, dispatching");
        if (jobManager_.dispatch(plan, Trigger::Automatic, false)) {
            dispatched.push_back(plan.id);
        }
    }
    return dispatched;
}

std::optional<utils::TimePoint> BackupScheduler::getNextRunTime(const std::string& planId,
                                                                utils::TimePoint after) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schedules_.find(planId);
    if (it == schedules_.end() || !it->second.cron) {
        return std::nullopt;
    }
    return it->second.cron->next(after);
}

bool BackupScheduler::isScheduled(const std::string& planId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return schedules_.count(planId) > 0;
}

void BackupScheduler::start() {
    if (running_) {
        return;
    }
    stopRequested_ = false;
    running_ = true;
    schedulerThread_ = std::thread(&BackupScheduler::checkSchedules, this);
    Logger::info("Backup scheduler started, tick every " + std::to_string(tickInterval_.count()) + "s");
}

void BackupScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_ = true;
    }
    wakeup_.notify_all();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
        Logger::info("Backup scheduler stopped");
    }
    running_ = false;
}

void BackupScheduler::checkSchedules() {
    auto nextTick = std::chrono::steady_clock::now();
    while (!stopRequested_) {
        tick(clock_());

        nextTick += tickInterval_;
        std::unique_lock<std::mutex> lock(waitMutex_);
        wakeup_.wait_until(lock, nextTick, [this] { return stopRequested_.load(); });
    }
}
