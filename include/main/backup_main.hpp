#pragma once

#include "common/service_config.hpp"
#include <string>

// Print the command usage information
void printBackupUsage();

// Main entry point for every syncwarden command; argv[0] is the command name.
int backupMain(const ServiceConfig& config, int argc, char* argv[]);
