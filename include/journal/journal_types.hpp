#pragma once

#include "common/utils.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class LogAction {
    Copy,
    Delete,
    Ignored,
    CopyError,
    DeleteError,
    System
};

const char* logActionToString(LogAction action);
bool parseLogAction(const std::string& name, LogAction& action);

// One run of one plan.
struct BackupExecution {
    std::string id;
    std::string planId;
    std::string name;
    utils::TimePoint startTime{};
    std::optional<utils::TimePoint> endTime;
    std::optional<std::string> currentFileName;
    std::optional<std::string> currentFilePath;
    bool automatic = false;
    bool simulation = false;

    bool isFinished() const { return endTime.has_value(); }
};

// One audited decision. Never modified once written.
struct LogEntry {
    std::string id;
    std::string planId;
    std::string executionId;
    utils::TimePoint timestamp{};
    std::string fileName;
    std::string filePath;
    std::optional<int64_t> size;
    LogAction action = LogAction::System;
    std::string reason;
};

struct LogQuery {
    std::optional<LogAction> action;
    std::optional<utils::TimePoint> from;   // inclusive
    std::optional<utils::TimePoint> until;  // exclusive

    bool matches(const LogEntry& entry) const;
};

void to_json(nlohmann::json& j, const BackupExecution& execution);
void from_json(const nlohmann::json& j, BackupExecution& execution);
void to_json(nlohmann::json& j, const LogEntry& entry);
void from_json(const nlohmann::json& j, LogEntry& entry);
