#include "common/job_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>

JobManager::JobManager(TransferExecutor& executor)
    : executor_(executor) {
}

JobManager::~JobManager() {
    try {
        stopAllJobs();
        cleanupCompletedJobs();
    } catch (const std::exception& e) {
        Logger::error("Error during JobManager cleanup: " + std::string(e.what()));
    }
}

std::shared_ptr<BackupJob> JobManager::runningJobFor(const std::string& planId) const {
    for (const auto& pair : backupJobs_) {
        if (pair.second->getPlanId() == planId && !pair.second->isFinished()) {
            return pair.second;
        }
    }
    return nullptr;
}

std::shared_ptr<BackupJob> JobManager::dispatch(const BackupPlan& plan, Trigger trigger, bool simulate) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto running = runningJobFor(plan.id)) {
        lastError_ = "Plan '" + plan.name + "' already has a run in flight (job " + running->getId() + ")";
        Logger::warning(lastError_);
        return nullptr;
    }

    auto job = std::make_shared<BackupJob>(executor_, plan, trigger, simulate);
    if (!job->start()) {
        lastError_ = "Failed to start job for plan '" + plan.name + "': " + job->getError();
        Logger::error(lastError_);
        return nullptr;
    }

    backupJobs_[job->getId()] = job;
    Logger::info("Dispatched job " + job->getId() + " for plan '" + plan.name + "'");
    return job;
}

bool JobManager::isPlanRunning(const std::string& planId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runningJobFor(planId) != nullptr;
}

bool JobManager::cancelPlan(const std::string& planId) {
    std::shared_ptr<BackupJob> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job = runningJobFor(planId);
    }
    if (!job) {
        return false;
    }
    return job->cancel();
}

std::vector<std::shared_ptr<BackupJob>> JobManager::getBackupJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<BackupJob>> result;
    result.reserve(backupJobs_.size());
    for (const auto& pair : backupJobs_) {
        result.push_back(pair.second);
    }
    return result;
}

std::shared_ptr<BackupJob> JobManager::getBackupJob(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backupJobs_.find(jobId);
    return it != backupJobs_.end() ? it->second : nullptr;
}

bool JobManager::removeJob(const std::string& jobId) {
    std::shared_ptr<BackupJob> job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = backupJobs_.find(jobId);
        if (it == backupJobs_.end()) {
            return false;
        }
        if (!it->second->isFinished()) {
            lastError_ = "Job " + jobId + " is still running";
            return false;
        }
        job = it->second;
        backupJobs_.erase(it);
    }
    job->wait();
    return true;
}

void JobManager::cleanupCompletedJobs() {
    std::vector<std::shared_ptr<BackupJob>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = backupJobs_.begin(); it != backupJobs_.end();) {
            if (it->second->isFinished()) {
                finished.push_back(it->second);
                it = backupJobs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // the worker may still be unwinding after flipping its state
    for (auto& job : finished) {
        job->wait();
    }
}

void JobManager::stopAllJobs() {
    auto jobs = getBackupJobs();
    for (auto& job : jobs) {
        if (!job->isFinished()) {
            job->cancel();
        }
    }
    for (auto& job : jobs) {
        job->wait();
    }
}

void JobManager::waitForAll() {
    for (auto& job : getBackupJobs()) {
        job->wait();
    }
}

std::string JobManager::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}
