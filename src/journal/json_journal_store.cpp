#include "journal/json_journal_store.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void writeAtomically(const std::string& path, const std::string& content) {
    std::string error;
    if (!utils::writeFileAtomically(path, content, error)) {
        throw PersistenceError(error);
    }
}

} // namespace

JsonJournalStore::JsonJournalStore(const std::string& directory)
    : directory_(directory),
      executionsPath_((fs::path(directory) / "executions.json").string()),
      logEntriesPath_((fs::path(directory) / "log_entries.jsonl").string()),
      lockPath_((fs::path(directory) / ".journal.lock").string()) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw PersistenceError("Cannot create journal directory " + directory_ + ": " + ec.message());
    }
}

std::unique_ptr<utils::FileLock> JsonJournalStore::lockStore(bool exclusive) const {
    try {
        return std::make_unique<utils::FileLock>(lockPath_, exclusive);
    } catch (const std::system_error& e) {
        throw PersistenceError(e.what());
    }
}

std::vector<BackupExecution> JsonJournalStore::loadExecutions() const {
    std::vector<BackupExecution> executions;
    if (!fs::exists(executionsPath_)) {
        return executions;
    }
    std::ifstream file(executionsPath_);
    if (!file.is_open()) {
        throw PersistenceError("Cannot open " + executionsPath_);
    }
    try {
        json doc = json::parse(file);
        for (const auto& item : doc.at("executions")) {
            executions.push_back(item.get<BackupExecution>());
        }
    } catch (const std::exception& e) {
        throw PersistenceError("Corrupt execution table " + executionsPath_ + ": " + e.what());
    }
    return executions;
}

void JsonJournalStore::saveExecutions(const std::vector<BackupExecution>& executions) const {
    json doc;
    doc["executions"] = executions;
    writeAtomically(executionsPath_, doc.dump(2));
}

void JsonJournalStore::insertExecution(const BackupExecution& execution) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);
    auto executions = loadExecutions();
    auto it = std::find_if(executions.begin(), executions.end(),
                           [&](const BackupExecution& e) { return e.id == execution.id; });
    if (it != executions.end()) {
        throw PersistenceError("Execution " + execution.id + " already exists");
    }
    executions.push_back(execution);
    saveExecutions(executions);
}

void JsonJournalStore::updateExecution(const BackupExecution& execution) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);
    auto executions = loadExecutions();
    auto it = std::find_if(executions.begin(), executions.end(),
                           [&](const BackupExecution& e) { return e.id == execution.id; });
    if (it == executions.end()) {
        throw PersistenceError("Execution " + execution.id + " not found");
    }
    *it = execution;
    saveExecutions(executions);
}

std::optional<BackupExecution> JsonJournalStore::findExecution(const std::string& executionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(false);
    for (auto& execution : loadExecutions()) {
        if (execution.id == executionId) {
            return execution;
        }
    }
    return std::nullopt;
}

std::vector<BackupExecution> JsonJournalStore::listExecutions(const std::string& planId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(false);
    std::vector<BackupExecution> result;
    for (auto& execution : loadExecutions()) {
        if (planId.empty() || execution.planId == planId) {
            result.push_back(std::move(execution));
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const BackupExecution& a, const BackupExecution& b) {
                         return a.startTime > b.startTime;
                     });
    return result;
}

void JsonJournalStore::appendLogEntry(const LogEntry& entry) {
    std::string line = json(entry).dump();
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);
    std::ofstream file(logEntriesPath_, std::ios::app);
    if (!file.is_open()) {
        throw PersistenceError("Cannot open " + logEntriesPath_ + " for appending");
    }
    file << line << '\n';
    file.flush();
    if (!file) {
        throw PersistenceError("Failed appending to " + logEntriesPath_);
    }
}

std::vector<LogEntry> JsonJournalStore::readLogEntries() const {
    std::vector<LogEntry> entries;
    if (!fs::exists(logEntriesPath_)) {
        return entries;
    }
    std::ifstream file(logEntriesPath_);
    if (!file.is_open()) {
        throw PersistenceError("Cannot open " + logEntriesPath_);
    }
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (utils::trim(line).empty()) {
            continue;
        }
        try {
            entries.push_back(json::parse(line).get<LogEntry>());
        } catch (const std::exception& e) {
            // a torn last line after a crash must not hide the rest of the journal
            Logger::warning("Skipping unreadable log entry at " + logEntriesPath_ + ":" +
                            std::to_string(lineNumber) + ": " + e.what());
        }
    }
    return entries;
}

void JsonJournalStore::rewriteLogEntries(const std::vector<LogEntry>& entries) const {
    std::ostringstream content;
    for (const auto& entry : entries) {
        content << json(entry).dump() << '\n';
    }
    writeAtomically(logEntriesPath_, content.str());
}

std::vector<LogEntry> JsonJournalStore::listLogEntries(const std::string& executionId,
                                                       const LogQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(false);
    std::vector<LogEntry> result;
    for (auto& entry : readLogEntries()) {
        if (entry.executionId == executionId && query.matches(entry)) {
            result.push_back(std::move(entry));
        }
    }
    return result;
}

std::size_t JsonJournalStore::deleteExecutionsBefore(utils::TimePoint cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fileLock = lockStore(true);

    std::unordered_set<std::string> removed;
    std::vector<BackupExecution> kept;
    for (auto& execution : loadExecutions()) {
        if (execution.isFinished() && execution.startTime < cutoff) {
            removed.insert(execution.id);
        } else {
            kept.push_back(std::move(execution));
        }
    }
    if (removed.empty()) {
        return 0;
    }

    std::vector<LogEntry> entries = readLogEntries();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const LogEntry& entry) {
                                     return removed.count(entry.executionId) > 0;
                                 }),
                  entries.end());

    rewriteLogEntries(entries);
    saveExecutions(kept);
    return removed.size();
}
