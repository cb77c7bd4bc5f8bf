#pragma once

#include "backup/backup_scheduler.hpp"
#include "backup/transfer_executor.hpp"
#include "common/job_manager.hpp"
#include "common/service_config.hpp"
#include "journal/execution_journal.hpp"
#include "journal/json_journal_store.hpp"
#include "store/json_config_store.hpp"
#include "common/logger.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

// Operator commands over the stores named by a ServiceConfig. Every handler
// returns the process exit code.
class BackupCLI {
public:
    explicit BackupCLI(const ServiceConfig& config);
    ~BackupCLI();

    int run(const std::vector<std::string>& args);
    void printUsage() const;

    // Set from a signal handler to end the daemon loop.
    static void requestShutdown();

private:
    int handleDaemonCommand();
    int handleRunCommand(const std::vector<std::string>& args, bool simulate);
    int handlePlansCommand();
    int handleAgentsCommand(const std::vector<std::string>& args);
    int handleExecutionsCommand(const std::vector<std::string>& args);
    int handleLogsCommand(const std::vector<std::string>& args);
    int handlePairCommand(const std::vector<std::string>& args);
    int handlePairingCodeCommand();
    int handlePairingStatusCommand();
    int handleUnpairCommand();
    int handleRedeemCodeCommand(const std::vector<std::string>& args);
    int handleCheckTokenCommand(const std::vector<std::string>& args);
    int handlePurgeLogsCommand(const std::vector<std::string>& args);

    void printReport(const ExecutionReport& report) const;
    std::string formatTime(utils::TimePoint time) const;

    ServiceConfig config_;
    std::unique_ptr<JsonConfigStore> configStore_;
    std::unique_ptr<JsonJournalStore> journalStore_;
    std::unique_ptr<ExecutionJournal> journal_;
    std::unique_ptr<TransferExecutor> executor_;
    std::unique_ptr<JobManager> jobManager_;

    static std::atomic<bool> shutdownRequested_;
};
