#pragma once

#include "common/logger.hpp"
#include <string>

// Process-wide settings, read from a JSON file. Every key is optional.
struct ServiceConfig {
    std::string dataDir = "/var/lib/syncwarden";
    std::string logPath = "/var/log/syncwarden/syncwarden.log";
    LogLevel logLevel = LogLevel::INFO;

    int tickIntervalSeconds = 60;
    int listTimeoutSeconds = 30;
    int transferTimeoutSeconds = 300;
    int connectTimeoutSeconds = 10;
    bool verifyTls = true;
    std::string caBundle;  // empty: libcurl default trust store

    int pairingCodeTtlMinutes = 10;
    int retentionMonths = 0;  // 0 disables the purge
    bool computeChecksums = false;
    bool caseInsensitiveDestination = false;

    std::string configStorePath() const { return dataDir + "/config.json"; }
    std::string journalDir() const { return dataDir + "/journal"; }

    // Throws ConfigurationError when the file exists but cannot be parsed or
    // holds a value of the wrong type. A missing file yields the defaults.
    static ServiceConfig loadFromFile(const std::string& path);
    static ServiceConfig fromJsonText(const std::string& text);
};
