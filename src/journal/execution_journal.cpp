#include "journal/execution_journal.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"

ExecutionJournal::ExecutionJournal(JournalRepository& repository, Clock clock)
    : repository_(repository), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::string ExecutionJournal::executionName(utils::TimePoint start, Trigger trigger, bool simulate,
                                            const std::string& planName) {
    std::string kind = simulate ? "Simulation" : triggerToString(trigger);
    return utils::formatShortUtc(start) + " - " + kind + " - " + planName;
}

std::string ExecutionJournal::beginExecution(const BackupPlan& plan, Trigger trigger, bool simulate) {
    BackupExecution execution;
    execution.id = utils::generateId();
    execution.planId = plan.id;
    execution.startTime = clock_();
    execution.name = executionName(execution.startTime, trigger, simulate, plan.name);
    execution.automatic = trigger == Trigger::Automatic;
    execution.simulation = simulate;

    try {
        repository_.insertExecution(execution);
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceError("Cannot record execution for plan '" + plan.name + "': " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_[execution.id] = execution;
    }
    Logger::info("Started execution " + execution.id + ": " + execution.name);
    return execution.id;
}

std::optional<BackupExecution> ExecutionJournal::lookup(const std::string& executionId) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = open_.find(executionId);
        if (it != open_.end()) {
            return it->second;
        }
    }
    return repository_.findExecution(executionId);
}

void ExecutionJournal::setCurrentFile(const std::string& executionId, const std::string& name,
                                      const std::string& path) {
    try {
        auto execution = lookup(executionId);
        if (!execution || execution->isFinished()) {
            Logger::warning("Progress update for unknown or finished execution " + executionId);
            return;
        }
        execution->currentFileName = name;
        execution->currentFilePath = path;
        repository_.updateExecution(*execution);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = open_.find(executionId);
        if (it != open_.end()) {
            it->second = *execution;
        }
    } catch (const std::exception& e) {
        setLastError(e.what());
        Logger::warning("Failed to update progress of execution " + executionId + ": " + e.what());
    }
}

bool ExecutionJournal::appendEntry(const std::string& executionId, LogEntry entry) {
    try {
        auto execution = lookup(executionId);
        if (!execution) {
            setLastError("Unknown execution " + executionId);
            Logger::error("Log entry for unknown execution " + executionId + " dropped");
            return false;
        }
        entry.id = utils::generateId();
        entry.planId = execution->planId;
        entry.executionId = executionId;
        entry.timestamp = clock_();
        repository_.appendLogEntry(entry);
        return true;
    } catch (const std::exception& e) {
        setLastError(e.what());
        Logger::error("Failed to journal " + std::string(logActionToString(entry.action)) +
                      " for " + entry.filePath + ": " + e.what());
        return false;
    }
}

bool ExecutionJournal::appendLogEntry(const std::string& executionId, const FileEntry& fileEntry,
                                      LogAction action, const std::string& reason) {
    LogEntry entry;
    entry.fileName = fileEntry.name;
    entry.filePath = fileEntry.path;
    entry.size = fileEntry.size;
    entry.action = action;
    entry.reason = reason;
    return appendEntry(executionId, std::move(entry));
}

bool ExecutionJournal::appendSystemEvent(const std::string& executionId, const std::string& title,
                                         const std::string& description) {
    LogEntry entry;
    entry.fileName = title;
    entry.action = LogAction::System;
    entry.reason = description;
    return appendEntry(executionId, std::move(entry));
}

bool ExecutionJournal::endExecution(const std::string& executionId) {
    try {
        auto execution = lookup(executionId);
        if (!execution) {
            setLastError("Unknown execution " + executionId);
            return false;
        }
        if (execution->isFinished()) {
            Logger::warning("Execution " + executionId + " already ended");
            return false;
        }
        execution->endTime = clock_();
        execution->currentFileName.reset();
        execution->currentFilePath.reset();
        repository_.updateExecution(*execution);
    } catch (const std::exception& e) {
        setLastError(e.what());
        Logger::error("Failed to close execution " + executionId + ": " + e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        open_.erase(executionId);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    open_.erase(executionId);
    Logger::info("Finished execution " + executionId);
    return true;
}

std::string ExecutionJournal::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void ExecutionJournal::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_ = error;
}
