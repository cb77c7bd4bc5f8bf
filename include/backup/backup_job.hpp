#pragma once

#include "common/job.hpp"
#include "backup/backup_plan.hpp"
#include "backup/transfer_executor.hpp"
#include "common/logger.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <mutex>

// One run of one plan on its own thread.
class BackupJob : public Job {
public:
    BackupJob(TransferExecutor& executor, const BackupPlan& plan, Trigger trigger, bool simulate);
    ~BackupJob() override;

    BackupJob(const BackupJob&) = delete;
    BackupJob& operator=(const BackupJob&) = delete;

    // Job interface implementation
    bool start() override;
    bool cancel() override;
    void wait() override;

    const BackupPlan& getPlan() const { return plan_; }
    std::string getPlanId() const { return plan_.id; }
    Trigger getTrigger() const { return trigger_; }
    bool isSimulation() const { return simulate_; }

    // Set once the run has returned a report.
    std::optional<ExecutionReport> getReport() const;

private:
    void executeBackup();

    TransferExecutor& executor_;
    BackupPlan plan_;
    Trigger trigger_;
    bool simulate_;
    std::atomic<bool> cancelRequested_{false};
    std::optional<ExecutionReport> report_;
    std::thread worker_;
    mutable std::mutex reportMutex_;
    std::mutex joinMutex_;
};
