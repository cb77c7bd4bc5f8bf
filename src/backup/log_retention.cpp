#include "backup/log_retention.hpp"
#include "common/logger.hpp"

LogRetention::LogRetention(JournalRepository& journal, int retentionMonths)
    : journal_(journal), retentionMonths_(retentionMonths) {
}

utils::TimePoint LogRetention::cutoff(utils::TimePoint now) const {
    return utils::startOfDayUtc(utils::addMonthsUtc(now, -retentionMonths_));
}

std::size_t LogRetention::purge(utils::TimePoint now) {
    if (!enabled()) {
        Logger::debug("Log retention disabled, skipping purge");
        return 0;
    }

    auto limit = cutoff(now);
    Logger::info("Purging executions started before " + utils::formatIso8601(limit) +
                 " (retention " + std::to_string(retentionMonths_) + " months)");
    std::size_t removed = journal_.deleteExecutionsBefore(limit);
    if (removed > 0) {
        Logger::info("Purged " + std::to_string(removed) + " executions and their log entries");
    } else {
        Logger::debug("No executions older than the retention period");
    }
    return removed;
}
