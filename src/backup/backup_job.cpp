#include "backup/backup_job.hpp"
#include "common/logger.hpp"
#include <system_error>

BackupJob::BackupJob(TransferExecutor& executor, const BackupPlan& plan, Trigger trigger, bool simulate)
    : executor_(executor)
    , plan_(plan)
    , trigger_(trigger)
    , simulate_(simulate) {
    setStatus("pending");
}

BackupJob::~BackupJob() {
    cancelRequested_ = true;
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

bool BackupJob::start() {
    if (getState() != State::PENDING) {
        setError("Cannot start job in current state");
        return false;
    }

    setState(State::RUNNING);
    setStatus(simulate_ ? "Simulating" : "Running");
    updateProgress(0);

    try {
        worker_ = std::thread(&BackupJob::executeBackup, this);
    } catch (const std::system_error& e) {
        setError(std::string("Cannot start worker thread: ") + e.what());
        setState(State::FAILED);
        return false;
    }
    return true;
}

void BackupJob::executeBackup() {
    try {
        ExecutionReport report = executor_.run(plan_, trigger_, simulate_, &cancelRequested_,
                                               [this](int progress) { updateProgress(progress); });
        bool wasCancelled = report.cancelled;
        bool hadErrors = report.hasErrors();
        {
            std::lock_guard<std::mutex> lock(reportMutex_);
            report_ = std::move(report);
        }
        if (wasCancelled) {
            setStatus("Cancelled");
            setState(State::CANCELLED);
        } else {
            updateProgress(100);
            setStatus(hadErrors ? "Completed with item errors" : "Completed");
            setState(State::COMPLETED);
        }
    } catch (const std::exception& e) {
        Logger::error("Backup job " + getId() + " for plan '" + plan_.name + "' failed: " + e.what());
        setError(e.what());
        setStatus("Failed");
        setState(State::FAILED);
    }
}

bool BackupJob::cancel() {
    if (isFinished()) {
        setError("Cannot cancel job in current state");
        return false;
    }
    cancelRequested_ = true;
    setStatus("Cancelling");
    Logger::info("Cancellation requested for job " + getId() + " (plan '" + plan_.name + "')");
    return true;
}

void BackupJob::wait() {
    std::lock_guard<std::mutex> lock(joinMutex_);
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

std::optional<ExecutionReport> BackupJob::getReport() const {
    std::lock_guard<std::mutex> lock(reportMutex_);
    return report_;
}
