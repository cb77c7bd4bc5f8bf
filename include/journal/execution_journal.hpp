#pragma once

#include "backup/backup_plan.hpp"
#include "backup/file_entry.hpp"
#include "journal/journal_repository.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

// Bookkeeping around one run: opens the execution, records every decision and
// closes it. Only beginExecution may fail loudly; a run that is already moving
// files is never stopped by a journal write.
class ExecutionJournal {
public:
    using Clock = std::function<utils::TimePoint()>;

    explicit ExecutionJournal(JournalRepository& repository, Clock clock = Clock());

    // Throws PersistenceError when the execution row cannot be written.
    std::string beginExecution(const BackupPlan& plan, Trigger trigger, bool simulate);

    // Live progress pointer.
    void setCurrentFile(const std::string& executionId, const std::string& name,
                        const std::string& path);

    bool appendLogEntry(const std::string& executionId, const FileEntry& entry,
                        LogAction action, const std::string& reason);

    // Milestone entry with action System.
    bool appendSystemEvent(const std::string& executionId, const std::string& title,
                           const std::string& description);

    // Sets the end time and clears the progress pointer. Second calls are ignored.
    bool endExecution(const std::string& executionId);

    JournalRepository& repository() { return repository_; }
    std::string getLastError() const;

    static std::string executionName(utils::TimePoint start, Trigger trigger, bool simulate,
                                     const std::string& planName);

private:
    bool appendEntry(const std::string& executionId, LogEntry entry);
    std::optional<BackupExecution> lookup(const std::string& executionId) const;
    void setLastError(const std::string& error);

    JournalRepository& repository_;
    Clock clock_;
    std::unordered_map<std::string, BackupExecution> open_;
    std::string lastError_;
    mutable std::mutex mutex_;
};
