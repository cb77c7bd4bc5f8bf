#include "common/service_config.hpp"
#include "common/backup_errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <typename T>
void readOptional(const json& doc, const char* key, T& target) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void requirePositive(int value, const char* key) {
    if (value <= 0) {
        throw ConfigurationError(std::string("'") + key + "' must be positive");
    }
}

} // namespace

ServiceConfig ServiceConfig::fromJsonText(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("Malformed configuration: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigurationError("Configuration root must be a JSON object");
    }

    ServiceConfig config;
    readOptional(doc, "dataDir", config.dataDir);
    readOptional(doc, "logPath", config.logPath);
    readOptional(doc, "tickIntervalSeconds", config.tickIntervalSeconds);
    readOptional(doc, "listTimeoutSeconds", config.listTimeoutSeconds);
    readOptional(doc, "transferTimeoutSeconds", config.transferTimeoutSeconds);
    readOptional(doc, "connectTimeoutSeconds", config.connectTimeoutSeconds);
    readOptional(doc, "verifyTls", config.verifyTls);
    readOptional(doc, "caBundle", config.caBundle);
    readOptional(doc, "pairingCodeTtlMinutes", config.pairingCodeTtlMinutes);
    readOptional(doc, "retentionMonths", config.retentionMonths);
    readOptional(doc, "computeChecksums", config.computeChecksums);
    readOptional(doc, "caseInsensitiveDestination", config.caseInsensitiveDestination);

    std::string level;
    readOptional(doc, "logLevel", level);
    if (!level.empty() && !Logger::parseLevel(level, config.logLevel)) {
        throw ConfigurationError("Unknown log level: " + level);
    }

    requirePositive(config.tickIntervalSeconds, "tickIntervalSeconds");
    requirePositive(config.listTimeoutSeconds, "listTimeoutSeconds");
    requirePositive(config.transferTimeoutSeconds, "transferTimeoutSeconds");
    requirePositive(config.connectTimeoutSeconds, "connectTimeoutSeconds");
    requirePositive(config.pairingCodeTtlMinutes, "pairingCodeTtlMinutes");
    if (config.retentionMonths < 0) {
        throw ConfigurationError("'retentionMonths' must not be negative");
    }
    if (config.dataDir.empty()) {
        throw ConfigurationError("'dataDir' must not be empty");
    }
    return config;
}

ServiceConfig ServiceConfig::loadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::warning("Configuration file " + path + " not found, using defaults");
        return ServiceConfig();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJsonText(buffer.str());
}
