#include "journal/journal_types.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {

struct ActionName {
    LogAction action;
    const char* name;
};

const ActionName kActionNames[] = {
    {LogAction::Copy, "Copy"},
    {LogAction::Delete, "Delete"},
    {LogAction::Ignored, "Ignored"},
    {LogAction::CopyError, "CopyError"},
    {LogAction::DeleteError, "DeleteError"},
    {LogAction::System, "System"},
};

json optionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

utils::TimePoint timeFrom(const json& value, const char* key) {
    auto parsed = utils::parseIso8601(value.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("invalid timestamp in '") + key + "'");
    }
    return *parsed;
}

} // namespace

const char* logActionToString(LogAction action) {
    for (const auto& entry : kActionNames) {
        if (entry.action == action) {
            return entry.name;
        }
    }
    return "System";
}

bool parseLogAction(const std::string& name, LogAction& action) {
    for (const auto& entry : kActionNames) {
        if (name == entry.name) {
            action = entry.action;
            return true;
        }
    }
    return false;
}

bool LogQuery::matches(const LogEntry& entry) const {
    if (action && entry.action != *action) {
        return false;
    }
    if (from && entry.timestamp < *from) {
        return false;
    }
    if (until && entry.timestamp >= *until) {
        return false;
    }
    return true;
}

void to_json(json& j, const BackupExecution& execution) {
    j = json{
        {"id", execution.id},
        {"planId", execution.planId},
        {"name", execution.name},
        {"startTime", utils::formatIso8601(execution.startTime)},
        {"endTime", execution.endTime ? json(utils::formatIso8601(*execution.endTime)) : json(nullptr)},
        {"currentFileName", optionalString(execution.currentFileName)},
        {"currentFilePath", optionalString(execution.currentFilePath)},
        {"isAutomatic", execution.automatic},
        {"isSimulation", execution.simulation}
    };
}

void from_json(const json& j, BackupExecution& execution) {
    execution.id = j.at("id").get<std::string>();
    execution.planId = j.at("planId").get<std::string>();
    execution.name = j.value("name", std::string());
    execution.startTime = timeFrom(j.at("startTime"), "startTime");
    execution.endTime.reset();
    if (j.contains("endTime") && !j["endTime"].is_null()) {
        execution.endTime = timeFrom(j["endTime"], "endTime");
    }
    execution.currentFileName.reset();
    execution.currentFilePath.reset();
    if (j.contains("currentFileName") && j["currentFileName"].is_string()) {
        execution.currentFileName = j["currentFileName"].get<std::string>();
    }
    if (j.contains("currentFilePath") && j["currentFilePath"].is_string()) {
        execution.currentFilePath = j["currentFilePath"].get<std::string>();
    }
    execution.automatic = j.value("isAutomatic", false);
    execution.simulation = j.value("isSimulation", false);
}

void to_json(json& j, const LogEntry& entry) {
    j = json{
        {"id", entry.id},
        {"planId", entry.planId},
        {"executionId", entry.executionId},
        {"datetime", utils::formatIso8601(entry.timestamp)},
        {"fileName", entry.fileName},
        {"filePath", entry.filePath},
        {"size", entry.size ? json(*entry.size) : json(nullptr)},
        {"action", logActionToString(entry.action)},
        {"reason", entry.reason}
    };
}

void from_json(const json& j, LogEntry& entry) {
    entry.id = j.at("id").get<std::string>();
    entry.planId = j.at("planId").get<std::string>();
    entry.executionId = j.at("executionId").get<std::string>();
    entry.timestamp = timeFrom(j.at("datetime"), "datetime");
    entry.fileName = j.value("fileName", std::string());
    entry.filePath = j.value("filePath", std::string());
    entry.size.reset();
    if (j.contains("size") && !j["size"].is_null()) {
        entry.size = j["size"].get<int64_t>();
    }
    std::string action = j.at("action").get<std::string>();
    if (!parseLogAction(action, entry.action)) {
        throw std::invalid_argument("unknown log action '" + action + "'");
    }
    entry.reason = j.value("reason", std::string());
}
