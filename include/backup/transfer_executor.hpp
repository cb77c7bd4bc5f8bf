#pragma once

#include "backup/backup_plan.hpp"
#include "backup/comparison_engine.hpp"
#include "backup/directory_provider_factory.hpp"
#include "journal/execution_journal.hpp"
#include "store/plan_repository.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

enum class ItemOperation {
    Copy,
    Delete,
    Skip
};

// Outcome of one planned or skipped item.
struct ItemResult {
    FileEntry entry;          // source entry for copies, destination entry otherwise
    std::string targetPath;   // destination path touched (or that would be)
    ItemOperation operation = ItemOperation::Skip;
    LogAction action = LogAction::Ignored;
    std::string reason;

    bool ok() const { return action != LogAction::CopyError && action != LogAction::DeleteError; }
};

struct ExecutionReport {
    std::string executionId;
    std::string planId;
    bool simulated = false;
    bool cancelled = false;

    int total = 0;         // planned copies + deletes
    int copies = 0;
    int deletes = 0;
    int ignored = 0;
    int copyErrors = 0;
    int deleteErrors = 0;

    std::vector<ItemResult> items;

    bool hasErrors() const { return copyErrors > 0 || deleteErrors > 0; }
};

struct TransferOptions {
    bool caseInsensitiveDestination = false;
    bool computeChecksums = false;
};

// Runs one plan: list both sides, compare, delete obsolete entries (deepest
// first), copy new and changed ones, and journal every decision. Symbolic links
// in the destination are left alone and journaled as Ignored. Failures before
// the first item abort the run and are rethrown after the execution is closed.
class TransferExecutor {
public:
    using ProgressCallback = std::function<void(int progress)>;

    TransferExecutor(PlanRepository& plans, ExecutionJournal& journal, ProviderFactory providerFactory,
                     const TransferOptions& options = TransferOptions());

    ExecutionReport run(const BackupPlan& plan, Trigger trigger, bool simulate,
                        const std::atomic<bool>* cancelFlag = nullptr,
                        ProgressCallback progress = ProgressCallback());

    // Agent record for the plan, if it links one that still exists.
    std::optional<Agent> linkedAgent(const BackupPlan& plan) const;

    static const char* const kReasonNotOnSource;
    static const char* const kReasonAlreadyGone;
    static const char* const kReasonNewFile;
    static const char* const kReasonNewDirectory;
    static const char* const kReasonSizeChanged;
    static const char* const kReasonSameSize;
    static const char* const kReasonCancelled;
    static const char* const kReasonEscapesRoot;
    static const char* const kReasonSymlink;
    static const char* const kReasonSymlinkRemoved;

private:
    struct RunContext;

    ItemResult deleteEntry(RunContext& ctx, const FileEntry& entry);
    ItemResult copyEntry(RunContext& ctx, const FileEntry& entry, bool changed);
    void record(RunContext& ctx, ItemResult result);
    void reportProgress(RunContext& ctx);
    bool cancelled(const RunContext& ctx) const;

    PlanRepository& plans_;
    ExecutionJournal& journal_;
    ProviderFactory providerFactory_;
    TransferOptions options_;
    ComparisonEngine engine_;
};
