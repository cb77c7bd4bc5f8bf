#pragma once

#include "journal/journal_repository.hpp"
#include "common/utils.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Journal kept in a directory: executions.json holds the execution table and is
// replaced atomically on every change, log_entries.jsonl is append-only with one
// JSON object per line. Nothing is cached: the daemon and CLI commands share the
// directory, so every call re-reads under the .journal.lock flock.
class JsonJournalStore : public JournalRepository {
public:
    explicit JsonJournalStore(const std::string& directory);

    void insertExecution(const BackupExecution& execution) override;
    void updateExecution(const BackupExecution& execution) override;
    std::optional<BackupExecution> findExecution(const std::string& executionId) const override;
    std::vector<BackupExecution> listExecutions(const std::string& planId) const override;

    void appendLogEntry(const LogEntry& entry) override;
    std::vector<LogEntry> listLogEntries(const std::string& executionId,
                                         const LogQuery& query) const override;

    std::size_t deleteExecutionsBefore(utils::TimePoint cutoff) override;

    const std::string& directory() const { return directory_; }

private:
    std::unique_ptr<utils::FileLock> lockStore(bool exclusive) const;
    std::vector<BackupExecution> loadExecutions() const;
    void saveExecutions(const std::vector<BackupExecution>& executions) const;
    std::vector<LogEntry> readLogEntries() const;
    void rewriteLogEntries(const std::vector<LogEntry>& entries) const;

    std::string directory_;
    std::string executionsPath_;
    std::string logEntriesPath_;
    std::string lockPath_;
    mutable std::mutex mutex_;
};
