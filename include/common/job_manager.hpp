#pragma once

#include "common/job.hpp"
#include "backup/backup_job.hpp"
#include "backup/transfer_executor.hpp"
#include "common/logger.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>

// Owns every dispatched run. At most one run per plan is in flight; runs of
// different plans proceed concurrently.
class JobManager {
public:
    explicit JobManager(TransferExecutor& executor);
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    // Starts a run without waiting for it. Returns nullptr (see getLastError)
    // when the plan already has a run in flight or the job cannot start.
    std::shared_ptr<BackupJob> dispatch(const BackupPlan& plan, Trigger trigger, bool simulate);

    bool isPlanRunning(const std::string& planId) const;
    bool cancelPlan(const std::string& planId);

    // Job registry and lookup
    std::vector<std::shared_ptr<BackupJob>> getBackupJobs() const;
    std::shared_ptr<BackupJob> getBackupJob(const std::string& jobId) const;

    // Job lifecycle management
    bool removeJob(const std::string& jobId);
    void cleanupCompletedJobs();
    // Cancels every job and waits for all of them.
    void stopAllJobs();
    void waitForAll();

    std::string getLastError() const;

private:
    std::shared_ptr<BackupJob> runningJobFor(const std::string& planId) const;

    TransferExecutor& executor_;
    std::unordered_map<std::string, std::shared_ptr<BackupJob>> backupJobs_;
    std::string lastError_;
    mutable std::mutex mutex_;
};
