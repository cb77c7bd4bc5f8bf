#pragma once

#include "journal/journal_types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Storage for executions and log entries. Every write throws PersistenceError
// on failure; ExecutionJournal decides which of those may abort a run.
class JournalRepository {
public:
    virtual ~JournalRepository() = default;

    virtual void insertExecution(const BackupExecution& execution) = 0;
    virtual void updateExecution(const BackupExecution& execution) = 0;
    virtual std::optional<BackupExecution> findExecution(const std::string& executionId) const = 0;

    // Newest first. An empty planId lists every plan.
    virtual std::vector<BackupExecution> listExecutions(const std::string& planId) const = 0;

    virtual void appendLogEntry(const LogEntry& entry) = 0;

    // Insertion order.
    virtual std::vector<LogEntry> listLogEntries(const std::string& executionId,
                                                 const LogQuery& query) const = 0;

    // Removes finished executions started before cutoff together with their log
    // entries. Returns the number of executions removed.
    virtual std::size_t deleteExecutionsBefore(utils::TimePoint cutoff) = 0;
};
