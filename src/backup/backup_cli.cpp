#include "backup/backup_cli.hpp"
#include "backup/cron_expression.hpp"
#include "backup/directory_provider_factory.hpp"
#include "backup/log_retention.hpp"
#include "common/backup_errors.hpp"
#include "common/scheduler.hpp"
#include "main/backup_main.hpp"
#include "pairing/agent_pairing.hpp"
#include "pairing/pairing_authority.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

std::atomic<bool> BackupCLI::shutdownRequested_{false};

namespace {

const char* const kRetentionTaskId = "log-retention";

AgentClientOptions clientOptions(const ServiceConfig& config) {
    AgentClientOptions options;
    options.connectTimeoutSeconds = config.connectTimeoutSeconds;
    options.listTimeoutSeconds = config.listTimeoutSeconds;
    options.transferTimeoutSeconds = config.transferTimeoutSeconds;
    options.verifyTls = config.verifyTls;
    options.caBundle = config.caBundle;
    return options;
}

} // namespace

BackupCLI::BackupCLI(const ServiceConfig& config)
    : config_(config) {
    configStore_ = std::make_unique<JsonConfigStore>(config_.configStorePath());
    journalStore_ = std::make_unique<JsonJournalStore>(config_.journalDir());
    journal_ = std::make_unique<ExecutionJournal>(*journalStore_);

    TransferOptions options;
    options.caseInsensitiveDestination = config_.caseInsensitiveDestination;
    options.computeChecksums = config_.computeChecksums;
    executor_ = std::make_unique<TransferExecutor>(*configStore_, *journal_,
                                                   makeProviderFactory(config_), options);
    jobManager_ = std::make_unique<JobManager>(*executor_);
}

BackupCLI::~BackupCLI() {
    jobManager_->stopAllJobs();
}

void BackupCLI::requestShutdown() {
    shutdownRequested_ = true;
}

void BackupCLI::printUsage() const {
    printBackupUsage();
}

int BackupCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }

    const std::string& command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "daemon") {
        return handleDaemonCommand();
    } else if (command == "run") {
        return handleRunCommand(rest, false);
    } else if (command == "simulate") {
        return handleRunCommand(rest, true);
    } else if (command == "plans") {
        return handlePlansCommand();
    } else if (command == "agents") {
        return handleAgentsCommand(rest);
    } else if (command == "executions") {
        return handleExecutionsCommand(rest);
    } else if (command == "logs") {
        return handleLogsCommand(rest);
    } else if (command == "pair") {
        return handlePairCommand(rest);
    } else if (command == "pairing-code") {
        return handlePairingCodeCommand();
    } else if (command == "pairing-status") {
        return handlePairingStatusCommand();
    } else if (command == "unpair") {
        return handleUnpairCommand();
    } else if (command == "redeem-code") {
        return handleRedeemCodeCommand(rest);
    } else if (command == "check-token") {
        return handleCheckTokenCommand(rest);
    } else if (command == "purge-logs") {
        return handlePurgeLogsCommand(rest);
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    Logger::error("Unknown command: " + command);
    printUsage();
    return 1;
}

std::string BackupCLI::formatTime(utils::TimePoint time) const {
    return utils::formatShortUtc(time) + " UTC";
}

int BackupCLI::handleDaemonCommand() {
    Logger::info("Starting SyncWarden daemon, data directory " + config_.dataDir);

    BackupScheduler scheduler(*configStore_, *jobManager_,
                              std::chrono::seconds(config_.tickIntervalSeconds));
    LogRetention retention(*journalStore_, config_.retentionMonths);

    Scheduler housekeeping;
    housekeeping.schedulePeriodicTask(kRetentionTaskId, std::chrono::hours(1), [&retention] {
        retention.purge(std::chrono::system_clock::now());
    }, true);

    housekeeping.start();
    scheduler.start();

    while (!shutdownRequested_) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    Logger::info("Shutdown requested, stopping scheduler and cancelling running jobs");
    scheduler.stop();
    housekeeping.stop();
    jobManager_->stopAllJobs();
    Logger::info("SyncWarden daemon stopped");
    return 0;
}

int BackupCLI::handleRunCommand(const std::vector<std::string>& args, bool simulate) {
    if (args.empty()) {
        std::cerr << "Error: plan id required" << std::endl;
        printUsage();
        return 1;
    }

    auto plan = configStore_->findPlan(args[0]);
    if (!plan) {
        std::cerr << "Error: Unknown plan: " << args[0] << std::endl;
        return 1;
    }

    auto job = jobManager_->dispatch(*plan, Trigger::Manual, simulate);
    if (!job) {
        std::cerr << "Error: " << jobManager_->getLastError() << std::endl;
        return 1;
    }

    job->setProgressCallback([](int progress) {
        std::cout << "\rProgress: " << progress << "%" << std::flush;
    });
    job->wait();
    std::cout << std::endl;

    auto report = job->getReport();
    if (report) {
        printReport(*report);
    }
    if (job->isFailed()) {
        std::cerr << "Run failed: " << job->getError() << std::endl;
        return 1;
    }
    if (job->isCancelled()) {
        return 1;
    }
    return report && report->hasErrors() ? 2 : 0;
}

void BackupCLI::printReport(const ExecutionReport& report) const {
    std::cout << (report.simulated ? "Simulation " : "Execution ") << report.executionId
              << (report.cancelled ? " (cancelled)" : "") << "\n"
              << "  planned:       " << report.total << "\n"
              << "  copied:        " << report.copies << "\n"
              << "  deleted:       " << report.deletes << "\n"
              << "  ignored:       " << report.ignored << "\n"
              << "  copy errors:   " << report.copyErrors << "\n"
              << "  delete errors: " << report.deleteErrors << "\n";
    for (const auto& item : report.items) {
        if (!item.ok()) {
            std::cout << "  " << logActionToString(item.action) << " " << item.entry.path
                      << ": " << item.reason << "\n";
        }
    }
}

int BackupCLI::handlePlansCommand() {
    auto now = std::chrono::system_clock::now();
    auto plans = configStore_->listPlans();
    if (plans.empty()) {
        std::cout << "No backup plans configured\n";
        return 0;
    }

    for (const auto& plan : plans) {
        std::string next = "-";
        if (plan.active) {
            try {
                auto when = CronExpression::parse(plan.schedule).next(now);
                next = when ? formatTime(*when) : "never";
            } catch (const ConfigurationError& e) {
                next = std::string("invalid schedule: ") + e.what();
            }
        }

        std::string transport;
        try {
            auto agent = plan.agentId ? configStore_->findAgent(*plan.agentId) : std::nullopt;
            transport = resolveTransport(plan, agent).describe();
        } catch (const ConfigurationError& e) {
            transport = std::string("unresolved: ") + e.what();
        }

        std::cout << plan.id << "  " << plan.name << "\n"
                  << "    " << plan.source << " -> " << plan.destination << "\n"
                  << "    schedule: " << plan.schedule << (plan.active ? "" : " (inactive)")
                  << ", next: " << next << "\n"
                  << "    transport: " << transport << "\n";
    }
    return 0;
}

int BackupCLI::handleAgentsCommand(const std::vector<std::string>& args) {
    bool ping = !args.empty() && args[0] == "--ping";
    if (!args.empty() && !ping) {
        std::cerr << "Error: usage: agents [--ping]" << std::endl;
        return 1;
    }

    auto agents = configStore_->listAgents();
    if (agents.empty()) {
        std::cout << "No agents configured\n";
        return 0;
    }

    for (const auto& agent : agents) {
        std::cout << agent.id << "  " << agent.name << "  "
                  << (agent.address.empty() ? "(no address)" : agent.address)
                  << (agent.isPaired() ? "  paired" : "  not paired");
        if (ping && agent.isPaired() && !agent.address.empty()) {
            AgentRestClient client(agent.address, *agent.token, clientOptions(config_));
            bool reachable = client.ping();
            std::cout << (reachable ? "  reachable" : "  unreachable: " + client.getLastError());
        }
        std::cout << "\n";
    }
    return 0;
}

int BackupCLI::handleExecutionsCommand(const std::vector<std::string>& args) {
    std::string planId = args.empty() ? "" : args[0];
    auto executions = journalStore_->listExecutions(planId);
    if (executions.empty()) {
        std::cout << "No executions recorded\n";
        return 0;
    }

    for (const auto& execution : executions) {
        std::cout << execution.id << "  " << execution.name << "\n"
                  << "    started: " << formatTime(execution.startTime)
                  << ", ended: " << (execution.endTime ? formatTime(*execution.endTime) : "running")
                  << "\n";
        if (execution.currentFilePath) {
            std::cout << "    current: " << *execution.currentFilePath << "\n";
        }
    }
    return 0;
}

int BackupCLI::handleLogsCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: execution id required" << std::endl;
        return 1;
    }

    LogQuery query;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (i + 1 >= args.size()) {
            std::cerr << "Error: " << arg << " requires a value" << std::endl;
            return 1;
        }
        const std::string& value = args[++i];
        if (arg == "--action") {
            LogAction action;
            if (!parseLogAction(value, action)) {
                std::cerr << "Error: Unknown action: " << value << std::endl;
                return 1;
            }
            query.action = action;
        } else if (arg == "--since" || arg == "--until") {
            auto time = utils::parseIso8601(value);
            if (!time) {
                std::cerr << "Error: Invalid time: " << value << std::endl;
                return 1;
            }
            (arg == "--since" ? query.from : query.until) = *time;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            return 1;
        }
    }

    if (!journalStore_->findExecution(args[0])) {
        std::cerr << "Error: Unknown execution: " << args[0] << std::endl;
        return 1;
    }

    for (const auto& entry : journalStore_->listLogEntries(args[0], query)) {
        std::cout << utils::formatIso8601(entry.timestamp) << "  "
                  << std::left << std::setw(11) << logActionToString(entry.action) << " "
                  << (entry.filePath.empty() ? entry.fileName : entry.filePath);
        if (entry.size) {
            std::cout << " (" << *entry.size << " bytes)";
        }
        std::cout << "  " << entry.reason << "\n";
    }
    return 0;
}

int BackupCLI::handlePairCommand(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Error: usage: pair <agentId> <code>" << std::endl;
        return 1;
    }

    AgentPairing pairing(*configStore_, clientOptions(config_));
    try {
        pairing.pair(args[0], args[1]);
    } catch (const AuthenticationError& e) {
        std::cerr << "Pairing failed (" << authReasonToString(e.reason()) << "): " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Agent " << args[0] << " paired\n";
    return 0;
}

int BackupCLI::handlePairingCodeCommand() {
    PairingAuthority authority(*configStore_, std::chrono::minutes(config_.pairingCodeTtlMinutes));
    if (authority.state() == PairingState::Paired) {
        std::cout << "This host is already paired; run 'unpair' first to issue a new code\n";
        return 1;
    }
    auto code = authority.generatePairingCode();
    std::cout << "Pairing code: " << code.code << "\n"
              << "Expires: " << formatTime(code.expiresAt) << "\n";
    return 0;
}

int BackupCLI::handlePairingStatusCommand() {
    PairingAuthority authority(*configStore_, std::chrono::minutes(config_.pairingCodeTtlMinutes));
    std::cout << pairingStateToString(authority.state()) << "\n";
    return 0;
}

int BackupCLI::handleUnpairCommand() {
    PairingAuthority authority(*configStore_, std::chrono::minutes(config_.pairingCodeTtlMinutes));
    auto code = authority.unpair();
    std::cout << "Token revoked. New pairing code: " << code.code << "\n"
              << "Expires: " << formatTime(code.expiresAt) << "\n";
    return 0;
}

// Agent-side counterpart of `pair`: exchanges a code issued here for the token.
int BackupCLI::handleRedeemCodeCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: usage: redeem-code <code>" << std::endl;
        return 1;
    }
    PairingAuthority authority(*configStore_, std::chrono::minutes(config_.pairingCodeTtlMinutes));
    try {
        std::string token = authority.redeemPairingCode(args[0]);
        std::cout << token << "\n";
        return 0;
    } catch (const AuthenticationError& e) {
        Logger::warning(std::string("Pairing code rejected: ") + e.what());
        std::cerr << "Error: " << authReasonToString(e.reason()) << ": " << e.what() << std::endl;
        return 1;
    }
}

int BackupCLI::handleCheckTokenCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: usage: check-token <token>" << std::endl;
        return 1;
    }
    PairingAuthority authority(*configStore_, std::chrono::minutes(config_.pairingCodeTtlMinutes));
    try {
        authority.validateToken(args[0]);
        std::cout << "Token valid\n";
        return 0;
    } catch (const AuthenticationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int BackupCLI::handlePurgeLogsCommand(const std::vector<std::string>& args) {
    int months = config_.retentionMonths;
    if (args.size() >= 2 && args[0] == "--months") {
        try {
            months = std::stoi(args[1]);
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid month count: " << args[1] << std::endl;
            return 1;
        }
    } else if (!args.empty()) {
        std::cerr << "Error: usage: purge-logs [--months N]" << std::endl;
        return 1;
    }

    LogRetention retention(*journalStore_, months);
    if (!retention.enabled()) {
        std::cout << "Log retention is disabled (retentionMonths = 0)\n";
        return 0;
    }
    auto removed = retention.purge(std::chrono::system_clock::now());
    std::cout << "Removed " << removed << " executions\n";
    return 0;
}
