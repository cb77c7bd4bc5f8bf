#pragma once

#include "journal/journal_repository.hpp"
#include <cstddef>

// Time-boxed purge of finished executions and their log entries.
class LogRetention {
public:
    LogRetention(JournalRepository& journal, int retentionMonths);

    bool enabled() const { return retentionMonths_ > 0; }

    // Midnight UTC, retentionMonths calendar months before now.
    utils::TimePoint cutoff(utils::TimePoint now) const;

    // Returns the number of executions removed; 0 when disabled. Throws
    // PersistenceError when the journal cannot be rewritten.
    std::size_t purge(utils::TimePoint now);

private:
    JournalRepository& journal_;
    int retentionMonths_;
};
