#include "main/backup_main.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include "common/service_config.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

const char* const kVersion = "1.0.0";
const char* const kDefaultConfigPath = "/etc/syncwarden/config.json";
const char* const kFallbackLogPath = "/tmp/syncwarden.log";

} // namespace

int main(int argc, char** argv) {
    std::string configPath = kDefaultConfigPath;
    std::vector<char*> commandArgs;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (commandArgs.empty() && (arg == "--help" || arg == "-h")) {
            printBackupUsage();
            return 0;
        }
        if (commandArgs.empty() && (arg == "--version" || arg == "-v")) {
            std::cout << "syncwarden version " << kVersion << "\n";
            return 0;
        }
        if (commandArgs.empty() && (arg == "--config" || arg == "-c")) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a file argument" << std::endl;
                return 1;
            }
            configPath = argv[++i];
            continue;
        }
        commandArgs.push_back(argv[i]);
    }

    if (commandArgs.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        printBackupUsage();
        return 1;
    }

    ServiceConfig config;
    try {
        config = ServiceConfig::loadFromFile(configPath);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (!Logger::initialize(config.logPath, config.logLevel)) {
        std::cerr << "Falling back to " << kFallbackLogPath << std::endl;
        if (!Logger::initialize(kFallbackLogPath, config.logLevel)) {
            std::cerr << "Failed to initialize logger" << std::endl;
            return 1;
        }
    }
    // Only the daemon narrates to the console; one-shot commands print their own output.
    Logger::setConsoleOutput(std::string(commandArgs[0]) == "daemon");

    int result = backupMain(config, static_cast<int>(commandArgs.size()), commandArgs.data());
    Logger::shutdown();
    return result;
}
