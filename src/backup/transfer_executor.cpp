#include "backup/transfer_executor.hpp"
#include "backup/local_directory.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

const char* const TransferExecutor::kReasonNotOnSource = "does not exist on source";
const char* const TransferExecutor::kReasonAlreadyGone = "file does not exist, cannot delete";
const char* const TransferExecutor::kReasonNewFile = "new file";
const char* const TransferExecutor::kReasonNewDirectory = "new directory";
const char* const TransferExecutor::kReasonSizeChanged = "size changed";
const char* const TransferExecutor::kReasonSameSize = "same size in both locations";
const char* const TransferExecutor::kReasonCancelled = "run cancelled";
const char* const TransferExecutor::kReasonEscapesRoot = "path escapes source root";
const char* const TransferExecutor::kReasonSymlink = "symbolic link, not synchronized";
const char* const TransferExecutor::kReasonSymlinkRemoved = "symbolic link removed with its parent directory";

namespace {

const char* const kEventAnalysisStarted = "Analysis Started";
const char* const kEventCopiesStarted = "Copies Started";
const char* const kEventCopiesFinished = "Copies Finished";
const char* const kEventRunFailed = "Run Failed";
const char* const kEventRunCancelled = "Run Cancelled";

// Relative paths from an agent are untrusted; ".." must never leave the destination.
bool escapesRoot(const std::string& relative) {
    fs::path path(relative);
    if (path.is_absolute()) {
        return true;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

} // namespace

struct TransferExecutor::RunContext {
    const BackupPlan& plan;
    std::string executionId;
    bool simulate;
    const std::atomic<bool>* cancelFlag;
    ProgressCallback progress;
    DirectoryProvider* provider = nullptr;
    ExecutionReport report;
    int processed = 0;
    std::vector<std::string> deletedDirectories;
};

TransferExecutor::TransferExecutor(PlanRepository& plans, ExecutionJournal& journal,
                                   ProviderFactory providerFactory, const TransferOptions& options)
    : plans_(plans),
      journal_(journal),
      providerFactory_(std::move(providerFactory)),
      options_(options),
      engine_(options.caseInsensitiveDestination) {
}

std::optional<Agent> TransferExecutor::linkedAgent(const BackupPlan& plan) const {
    if (!plan.agentId) {
        return std::nullopt;
    }
    auto agent = plans_.findAgent(*plan.agentId);
    if (!agent) {
        Logger::warning("Plan '" + plan.name + "' references missing agent " + *plan.agentId +
                        ", using inline transport");
    }
    return agent;
}

bool TransferExecutor::cancelled(const RunContext& ctx) const {
    return ctx.cancelFlag && ctx.cancelFlag->load();
}

void TransferExecutor::reportProgress(RunContext& ctx) {
    ++ctx.processed;
    if (ctx.progress && ctx.report.total > 0) {
        ctx.progress(ctx.processed * 100 / ctx.report.total);
    }
}

void TransferExecutor::record(RunContext& ctx, ItemResult result) {
    journal_.appendLogEntry(ctx.executionId, result.entry, result.action, result.reason);

    switch (result.action) {
        case LogAction::Copy:        ++ctx.report.copies; break;
        case LogAction::Delete:      ++ctx.report.deletes; break;
        case LogAction::Ignored:     ++ctx.report.ignored; break;
        case LogAction::CopyError:   ++ctx.report.copyErrors; break;
        case LogAction::DeleteError: ++ctx.report.deleteErrors; break;
        case LogAction::System:      break;
    }
    ctx.report.items.push_back(std::move(result));
}

ItemResult TransferExecutor::deleteEntry(RunContext& ctx, const FileEntry& entry) {
    ItemResult result;
    result.entry = entry;
    result.targetPath = entry.path;
    result.operation = ItemOperation::Delete;

    journal_.setCurrentFile(ctx.executionId, entry.name, entry.path);

    std::error_code ec;
    auto status = fs::symlink_status(entry.path, ec);
    if (ec || !fs::exists(status)) {
        result.action = LogAction::Ignored;
        result.reason = kReasonAlreadyGone;
        return result;
    }

    if (!ctx.simulate) {
        if (fs::is_directory(status)) {
            fs::remove_all(entry.path, ec);
        } else {
            fs::remove(entry.path, ec);
        }
        if (ec) {
            Logger::error("Failed to delete " + entry.path + ": " + ec.message());
            result.action = LogAction::DeleteError;
            result.reason = ec.message();
            return result;
        }
        Logger::debug("Deleted " + entry.path);
    }
    if (fs::is_directory(status)) {
        ctx.deletedDirectories.push_back(entry.path);
    }

    result.action = LogAction::Delete;
    result.reason = kReasonNotOnSource;
    return result;
}

ItemResult TransferExecutor::copyEntry(RunContext& ctx, const FileEntry& entry, bool changed) {
    ItemResult result;
    result.entry = entry;
    result.operation = ItemOperation::Copy;
    std::string relative = engine_.relativePath(entry, ctx.plan.source);
    result.targetPath = (fs::path(ctx.plan.destination) / relative).string();

    journal_.setCurrentFile(ctx.executionId, entry.name, entry.path);

    if (escapesRoot(relative)) {
        Logger::error("Refusing to copy " + entry.path + ": " + kReasonEscapesRoot);
        result.action = LogAction::CopyError;
        result.reason = kReasonEscapesRoot;
        return result;
    }

    std::string reason = entry.isDirectory() ? kReasonNewDirectory
                                             : (changed ? kReasonSizeChanged : kReasonNewFile);
    if (ctx.simulate) {
        result.action = LogAction::Copy;
        result.reason = reason;
        return result;
    }

    std::string stagingPath = LocalDirectory::stagingPathFor(result.targetPath);
    try {
        if (entry.isDirectory()) {
            fs::create_directories(result.targetPath);
        } else {
            fs::path parent = fs::path(result.targetPath).parent_path();
            if (!parent.empty()) {
                fs::create_directories(parent);
            }
            ctx.provider->fetchFile(entry, stagingPath);
            fs::rename(stagingPath, result.targetPath);
        }
        result.action = LogAction::Copy;
        result.reason = reason;
        Logger::debug("Copied " + entry.path + " to " + result.targetPath);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(stagingPath, ec);
        Logger::error("Failed to copy " + entry.path + ": " + e.what());
        result.action = LogAction::CopyError;
        result.reason = e.what();
    }
    return result;
}

ExecutionReport TransferExecutor::run(const BackupPlan& plan, Trigger trigger, bool simulate,
                                      const std::atomic<bool>* cancelFlag, ProgressCallback progress) {
    RunContext ctx{plan, journal_.beginExecution(plan, trigger, simulate), simulate, cancelFlag,
                   std::move(progress)};
    ctx.report.executionId = ctx.executionId;
    ctx.report.planId = plan.id;
    ctx.report.simulated = simulate;

    Logger::info(std::string(simulate ? "Simulating" : "Running") + " plan '" + plan.name +
                 "' (" + triggerToString(trigger) + ")");

    std::unique_ptr<DirectoryProvider> provider;
    FileEntryList sourceEntries;
    FileEntryList destEntries;
    ComparisonResult comparison;
    FileEntryList unchanged;
    std::vector<std::string> skippedLinks;
    try {
        journal_.appendSystemEvent(ctx.executionId, kEventAnalysisStarted,
                                   "Started analyzing source file structure");

        if (plan.source.empty() || plan.destination.empty()) {
            throw ConfigurationError("Plan '" + plan.name + "' needs both a source and a destination");
        }
        TransportConfig transport = resolveTransport(plan, linkedAgent(plan));
        provider = providerFactory_(transport);
        if (!provider) {
            throw ConfigurationError("No directory provider for " + transport.describe());
        }
        ctx.provider = provider.get();

        sourceEntries = provider->listEntries(plan.source);
        Logger::info("Retrieved " + std::to_string(sourceEntries.size()) + " items from " +
                     provider->describe() + " for " + plan.source);

        destEntries = LocalDirectory::listEntries(plan.destination, options_.computeChecksums,
                                                  !simulate, &skippedLinks);
        Logger::info("Retrieved " + std::to_string(destEntries.size()) +
                     " items from local destination " + plan.destination);

        comparison = engine_.compare(sourceEntries, destEntries, plan.source, plan.destination);
        unchanged = engine_.unchanged(sourceEntries, destEntries, plan.source, plan.destination);
    } catch (const std::exception& e) {
        Logger::error("Plan '" + plan.name + "' failed: " + e.what());
        journal_.appendSystemEvent(ctx.executionId, kEventRunFailed, e.what());
        journal_.endExecution(ctx.executionId);
        throw;
    }

    FileEntryList deletions = comparison.obsoleteEntries;
    std::stable_sort(deletions.begin(), deletions.end(), [](const FileEntry& a, const FileEntry& b) {
        return a.path.size() > b.path.size();
    });

    ctx.report.total = static_cast<int>(deletions.size() + comparison.newEntries.size() +
                                        comparison.changedEntries.size());
    Logger::info("Comparison complete: " +
                 std::to_string(comparison.newEntries.size() + comparison.changedEntries.size()) +
                 " items to copy, " + std::to_string(deletions.size()) + " items to delete");

    auto skipCancelled = [&](const FileEntry& entry, ItemOperation operation, const std::string& target) {
        ItemResult result;
        result.entry = entry;
        result.targetPath = target;
        result.operation = operation;
        result.action = LogAction::Ignored;
        result.reason = kReasonCancelled;
        record(ctx, std::move(result));
        ctx.report.cancelled = true;
    };

    for (const auto& entry : deletions) {
        if (cancelled(ctx)) {
            skipCancelled(entry, ItemOperation::Delete, entry.path);
            continue;
        }
        record(ctx, deleteEntry(ctx, entry));
        reportProgress(ctx);
    }

    journal_.appendSystemEvent(ctx.executionId, kEventCopiesStarted,
                               "Started copying files from source to destination");

    auto copyAll = [&](const FileEntryList& entries, bool changed) {
        for (const auto& entry : entries) {
            if (cancelled(ctx)) {
                skipCancelled(entry, ItemOperation::Copy,
                              (fs::path(plan.destination) / engine_.relativePath(entry, plan.source)).string());
                continue;
            }
            record(ctx, copyEntry(ctx, entry, changed));
            reportProgress(ctx);
        }
    };
    copyAll(comparison.newEntries, false);
    copyAll(comparison.changedEntries, true);

    journal_.appendSystemEvent(ctx.executionId, kEventCopiesFinished,
                               "Finished copying files from source to destination");

    for (const auto& entry : unchanged) {
        ItemResult result;
        result.entry = entry;
        result.targetPath = (fs::path(plan.destination) / engine_.relativePath(entry, plan.source)).string();
        result.operation = ItemOperation::Skip;
        result.action = LogAction::Ignored;
        result.reason = kReasonSameSize;
        record(ctx, std::move(result));
    }

    for (const auto& linkPath : skippedLinks) {
        ItemResult result;
        result.entry.name = fs::path(linkPath).filename().string();
        result.entry.path = linkPath;
        result.entry.root = plan.destination;
        result.targetPath = linkPath;
        result.operation = ItemOperation::Skip;
        result.action = LogAction::Ignored;
        bool removedWithParent = std::any_of(
            ctx.deletedDirectories.begin(), ctx.deletedDirectories.end(),
            [&](const std::string& dir) { return linkPath.compare(0, dir.size() + 1, dir + "/") == 0; });
        result.reason = removedWithParent ? kReasonSymlinkRemoved : kReasonSymlink;
        record(ctx, std::move(result));
    }

    if (ctx.report.cancelled) {
        journal_.appendSystemEvent(ctx.executionId, kEventRunCancelled,
                                   "Run cancelled before all items were processed");
        Logger::warning("Plan '" + plan.name + "' cancelled");
    }

    journal_.endExecution(ctx.executionId);

    const auto& report = ctx.report;
    Logger::info("Plan '" + plan.name + "' finished: " + std::to_string(report.copies) + " copied, " +
                 std::to_string(report.deletes) + " deleted, " + std::to_string(report.ignored) +
                 " ignored, " + std::to_string(report.copyErrors + report.deleteErrors) + " errors" +
                 (simulate ? " (simulation)" : ""));
    return ctx.report;
}
