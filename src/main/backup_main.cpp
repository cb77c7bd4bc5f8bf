#include "main/backup_main.hpp"
#include "backup/backup_cli.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

namespace {

void handleSignal(int) {
    BackupCLI::requestShutdown();
}

} // namespace

void printBackupUsage() {
    std::cout << "Usage: syncwarden [--config FILE] <command> [options]\n"
              << "Commands:\n"
              << "  daemon                        Run the scheduler until interrupted\n"
              << "  run <planId>                  Run a plan now\n"
              << "  simulate <planId>             Dry-run a plan; nothing is modified\n"
              << "  plans                         List plans and their next run\n"
              << "  agents [--ping]               List agents; --ping checks paired ones\n"
              << "  executions [planId]           List executions, newest first\n"
              << "  logs <executionId>            Show the log of an execution\n"
              << "      --action <A>              Copy, Delete, Ignored, CopyError, DeleteError or System\n"
              << "      --since <ISO-8601>        Entries at or after this time\n"
              << "      --until <ISO-8601>        Entries before this time\n"
              << "  pair <agentId> <code>         Exchange an agent's pairing code for a token\n"
              << "  pairing-code                  Show or generate this host's pairing code\n"
              << "  pairing-status                Show this host's pairing state\n"
              << "  unpair                        Revoke this host's token and issue a new code\n"
              << "  redeem-code <code>            Exchange a code issued here for the token\n"
              << "  check-token <token>           Exit 0 when the token matches this host's\n"
              << "  purge-logs [--months N]       Delete executions older than the retention period\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE    Service configuration (default /etc/syncwarden/config.json)\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n";
}

int backupMain(const ServiceConfig& config, int argc, char** argv) {
    try {
        std::vector<std::string> args(argv, argv + argc);
        if (!args.empty() && args[0] == "daemon") {
            std::signal(SIGINT, handleSignal);
            std::signal(SIGTERM, handleSignal);
        }

        BackupCLI cli(config);
        return cli.run(args);
    } catch (const BackupError& e) {
        Logger::error(e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        Logger::error("Error in backup main: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
