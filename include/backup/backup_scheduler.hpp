#pragma once

#include "backup/backup_plan.hpp"
#include "backup/cron_expression.hpp"
#include "common/job_manager.hpp"
#include "store/plan_repository.hpp"
#include "common/logger.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <optional>

// Polls the active plans on a fixed tick and dispatches the due ones to the
// JobManager. The held schedule is reconciled against the store on every tick
// instead of being rebuilt.
class BackupScheduler {
public:
    using Clock = std::function<utils::TimePoint()>;

    struct ReconcileResult {
        std::vector<std::string> added;
        std::vector<std::string> removed;
        std::vector<std::string> changed;
    };

    BackupScheduler(PlanRepository& plans, JobManager& jobManager,
                    std::chrono::seconds tickInterval = std::chrono::seconds(60),
                    Clock clock = Clock());
    ~BackupScheduler();

    BackupScheduler(const BackupScheduler&) = delete;
    BackupScheduler& operator=(const BackupScheduler&) = delete;

    // Loads the active plans and applies the difference to the held schedule.
    // Removed or deactivated plans have their in-flight run cancelled. Throws
    // when the store cannot be read.
    ReconcileResult reconcile();

    // One due-check at `now`: reconcile, then dispatch every due plan. Returns
    // the ids of the plans dispatched. Never throws.
    std::vector<std::string> tick(utils::TimePoint now);

    // Due when the first firing after now - 1 minute is not later than now.
    static bool isDue(const CronExpression& cron, utils::TimePoint now);

    std::optional<utils::TimePoint> getNextRunTime(const std::string& planId,
                                                   utils::TimePoint after) const;
    bool isScheduled(const std::string& planId) const;

    // Thread control
    void start();
    void stop();
    bool isRunning() const { return running_; }

private:
    struct ScheduleEntry {
        BackupPlan plan;
        std::optional<CronExpression> cron;  // unset when the expression does not parse
    };

    static ScheduleEntry makeEntry(const BackupPlan& plan);
    void checkSchedules();

    PlanRepository& plans_;
    JobManager& jobManager_;
    std::chrono::seconds tickInterval_;
    Clock clock_;

    std::map<std::string, ScheduleEntry> schedules_;
    mutable std::mutex mutex_;
    std::mutex tickMutex_;

    std::thread schedulerThread_;
    std::mutex waitMutex_;
    std::condition_variable wakeup_;
    std::atomic<bool> running_;
    std::atomic<bool> stopRequested_;
};
