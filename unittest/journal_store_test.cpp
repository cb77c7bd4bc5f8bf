#include <gtest/gtest.h>
#include "backup/log_retention.hpp"
#include "common/backup_errors.hpp"
#include "journal/execution_journal.hpp"
#include "journal/json_journal_store.hpp"
#include "test_support.hpp"

using namespace testsupport;

namespace {

utils::TimePoint at(const std::string& iso) {
    return *utils::parseIso8601(iso);
}

BackupExecution makeExecution(const std::string& id, const std::string& planId,
                              const std::string& start, bool finished = true) {
    BackupExecution execution;
    execution.id = id;
    execution.planId = planId;
    execution.name = "run " + id;
    execution.startTime = at(start);
    if (finished) {
        execution.endTime = execution.startTime + std::chrono::minutes(5);
    }
    return execution;
}

LogEntry makeEntry(const std::string& executionId, LogAction action, const std::string& time) {
    LogEntry entry;
    entry.id = utils::generateId();
    entry.planId = "p1";
    entry.executionId = executionId;
    entry.timestamp = at(time);
    entry.fileName = "f.txt";
    entry.filePath = "/src/f.txt";
    entry.action = action;
    entry.reason = "test";
    return entry;
}

} // namespace

class JsonJournalStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<JsonJournalStore>(tmp_.sub("journal"));
    }

    TempDir tmp_;
    std::unique_ptr<JsonJournalStore> store_;
};

TEST_F(JsonJournalStoreTest, ExecutionsSurviveReopen) {
    auto execution = makeExecution("e1", "p1", "2024-01-01T10:00:00Z", false);
    execution.automatic = true;
    execution.currentFileName = "a.txt";
    store_->insertExecution(execution);

    JsonJournalStore reopened(tmp_.sub("journal"));
    auto loaded = reopened.findExecution("e1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->planId, "p1");
    EXPECT_EQ(loaded->startTime, execution.startTime);
    EXPECT_TRUE(loaded->automatic);
    EXPECT_FALSE(loaded->simulation);
    EXPECT_FALSE(loaded->isFinished());
    EXPECT_EQ(loaded->currentFileName.value_or(""), "a.txt");
}

TEST_F(JsonJournalStoreTest, DuplicateInsertFails) {
    store_->insertExecution(makeExecution("e1", "p1", "2024-01-01T10:00:00Z"));
    EXPECT_THROW(store_->insertExecution(makeExecution("e1", "p1", "2024-01-01T10:00:00Z")),
                 PersistenceError);
}

TEST_F(JsonJournalStoreTest, UpdateUnknownExecutionFails) {
    EXPECT_THROW(store_->updateExecution(makeExecution("nope", "p1", "2024-01-01T10:00:00Z")),
                 PersistenceError);
}

TEST_F(JsonJournalStoreTest, ListExecutionsNewestFirst) {
    store_->insertExecution(makeExecution("old", "p1", "2024-01-01T10:00:00Z"));
    store_->insertExecution(makeExecution("new", "p1", "2024-01-03T10:00:00Z"));
    store_->insertExecution(makeExecution("other", "p2", "2024-01-02T10:00:00Z"));

    auto p1 = store_->listExecutions("p1");
    ASSERT_EQ(p1.size(), 2u);
    EXPECT_EQ(p1[0].id, "new");
    EXPECT_EQ(p1[1].id, "old");

    auto all = store_->listExecutions("");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[1].id, "other");
}

TEST_F(JsonJournalStoreTest, LogQueryFilters) {
    store_->insertExecution(makeExecution("e1", "p1", "2024-01-01T10:00:00Z"));
    store_->appendLogEntry(makeEntry("e1", LogAction::Copy, "2024-01-01T10:01:00Z"));
    store_->appendLogEntry(makeEntry("e1", LogAction::Delete, "2024-01-01T10:02:00Z"));
    store_->appendLogEntry(makeEntry("e1", LogAction::Copy, "2024-01-01T10:03:00Z"));
    store_->appendLogEntry(makeEntry("e2", LogAction::Copy, "2024-01-01T10:01:00Z"));

    EXPECT_EQ(store_->listLogEntries("e1", LogQuery()).size(), 3u);

    LogQuery copies;
    copies.action = LogAction::Copy;
    EXPECT_EQ(store_->listLogEntries("e1", copies).size(), 2u);

    LogQuery window;
    window.from = at("2024-01-01T10:02:00Z");
    window.until = at("2024-01-01T10:03:00Z");
    auto windowed = store_->listLogEntries("e1", window);
    ASSERT_EQ(windowed.size(), 1u);
    EXPECT_EQ(windowed[0].action, LogAction::Delete);
}

// A torn line does not hide the entries around it
TEST_F(JsonJournalStoreTest, UnreadableLineIsSkipped) {
    store_->appendLogEntry(makeEntry("e1", LogAction::Copy, "2024-01-01T10:01:00Z"));
    {
        std::ofstream file(tmp_.sub("journal/log_entries.jsonl"), std::ios::app);
        file << "{\"id\": \"broken\n";
    }
    store_->appendLogEntry(makeEntry("e1", LogAction::Delete, "2024-01-01T10:02:00Z"));

    EXPECT_EQ(store_->listLogEntries("e1", LogQuery()).size(), 2u);
}

TEST_F(JsonJournalStoreTest, CorruptExecutionTableIsPersistenceError) {
    writeFile(tmp_.sub("journal/executions.json"), 10, '{');
    JsonJournalStore corrupt(tmp_.sub("journal"));
    EXPECT_THROW(corrupt.listExecutions(""), PersistenceError);
}

TEST_F(JsonJournalStoreTest, DeleteBeforeKeepsOpenAndRecentExecutions) {
    store_->insertExecution(makeExecution("old", "p1", "2024-01-01T10:00:00Z"));
    store_->insertExecution(makeExecution("running", "p1", "2024-01-01T11:00:00Z", false));
    store_->insertExecution(makeExecution("recent", "p1", "2024-03-01T10:00:00Z"));
    store_->appendLogEntry(makeEntry("old", LogAction::Copy, "2024-01-01T10:01:00Z"));
    store_->appendLogEntry(makeEntry("recent", LogAction::Copy, "2024-03-01T10:01:00Z"));

    EXPECT_EQ(store_->deleteExecutionsBefore(at("2024-02-01T00:00:00Z")), 1u);

    EXPECT_FALSE(store_->findExecution("old").has_value());
    EXPECT_TRUE(store_->findExecution("running").has_value());
    EXPECT_TRUE(store_->findExecution("recent").has_value());
    EXPECT_TRUE(store_->listLogEntries("old", LogQuery()).empty());
    EXPECT_EQ(store_->listLogEntries("recent", LogQuery()).size(), 1u);

    EXPECT_EQ(store_->deleteExecutionsBefore(at("2024-02-01T00:00:00Z")), 0u);
}

// Test that the daemon and a CLI command sharing the journal do not drop each other's rows
TEST_F(JsonJournalStoreTest, SharedDirectoryKeepsOtherWritersRows) {
    JsonJournalStore daemon(tmp_.sub("journal"));
    JsonJournalStore cli(tmp_.sub("journal"));

    auto daemonRun = makeExecution("daemon-run", "p1", "2024-01-01T10:00:00Z", false);
    daemon.insertExecution(daemonRun);
    cli.insertExecution(makeExecution("cli-run", "p2", "2024-01-01T10:01:00Z", false));

    daemonRun.currentFileName = "a.txt";
    daemon.updateExecution(daemonRun);

    JsonJournalStore reader(tmp_.sub("journal"));
    EXPECT_TRUE(reader.findExecution("cli-run").has_value());
    EXPECT_EQ(reader.findExecution("daemon-run")->currentFileName, "a.txt");
    EXPECT_EQ(daemon.listExecutions("").size(), 2u);
}

TEST_F(JsonJournalStoreTest, PurgeByAnotherWriterIsNotUndone) {
    JsonJournalStore daemon(tmp_.sub("journal"));
    JsonJournalStore cli(tmp_.sub("journal"));

    daemon.insertExecution(makeExecution("old", "p1", "2024-01-01T10:00:00Z"));
    auto current = makeExecution("current", "p1", "2024-03-01T10:00:00Z", false);
    daemon.insertExecution(current);
    daemon.appendLogEntry(makeEntry("old", LogAction::Copy, "2024-01-01T10:01:00Z"));

    EXPECT_EQ(cli.deleteExecutionsBefore(at("2024-02-01T00:00:00Z")), 1u);

    current.currentFileName = "b.txt";
    daemon.updateExecution(current);

    JsonJournalStore reader(tmp_.sub("journal"));
    EXPECT_FALSE(reader.findExecution("old").has_value());
    EXPECT_TRUE(reader.listLogEntries("old", LogQuery()).empty());
    EXPECT_TRUE(reader.findExecution("current").has_value());
}

class ExecutionJournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = at("2024-06-15T08:30:00Z");
        store_ = std::make_unique<JsonJournalStore>(tmp_.sub("journal"));
        journal_ = std::make_unique<ExecutionJournal>(*store_, [this] { return now_; });
        plan_ = makePlan("p1", "/srv/data", tmp_.sub("dst"));
        plan_.name = "Nightly";
    }

    TempDir tmp_;
    utils::TimePoint now_;
    std::unique_ptr<JsonJournalStore> store_;
    std::unique_ptr<ExecutionJournal> journal_;
    BackupPlan plan_;
};

TEST_F(ExecutionJournalTest, ExecutionNames) {
    EXPECT_EQ(ExecutionJournal::executionName(now_, Trigger::Automatic, false, "Nightly"),
              "2024/06/15 08:30 - Automatic - Nightly");
    EXPECT_EQ(ExecutionJournal::executionName(now_, Trigger::Manual, false, "Nightly"),
              "2024/06/15 08:30 - Manual - Nightly");
    EXPECT_EQ(ExecutionJournal::executionName(now_, Trigger::Manual, true, "Nightly"),
              "2024/06/15 08:30 - Simulation - Nightly");
}

TEST_F(ExecutionJournalTest, LifecycleIsPersisted) {
    std::string id = journal_->beginExecution(plan_, Trigger::Automatic, false);

    auto started = store_->findExecution(id);
    ASSERT_TRUE(started.has_value());
    EXPECT_EQ(started->name, "2024/06/15 08:30 - Automatic - Nightly");
    EXPECT_TRUE(started->automatic);
    EXPECT_FALSE(started->isFinished());

    journal_->setCurrentFile(id, "a.txt", "/srv/data/a.txt");
    EXPECT_EQ(store_->findExecution(id)->currentFilePath.value_or(""), "/srv/data/a.txt");

    FileEntry entry = makeFile("/srv/data", "a.txt", 12);
    EXPECT_TRUE(journal_->appendLogEntry(id, entry, LogAction::Copy, "new file"));
    EXPECT_TRUE(journal_->appendSystemEvent(id, "Copies Finished", "done"));

    now_ += std::chrono::minutes(3);
    EXPECT_TRUE(journal_->endExecution(id));

    auto finished = store_->findExecution(id);
    ASSERT_TRUE(finished->isFinished());
    EXPECT_EQ(*finished->endTime, now_);
    EXPECT_FALSE(finished->currentFileName.has_value());
    EXPECT_FALSE(finished->currentFilePath.has_value());

    auto entries = store_->listLogEntries(id, LogQuery());
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].planId, "p1");
    EXPECT_EQ(entries[0].fileName, "a.txt");
    EXPECT_EQ(entries[0].size.value_or(0), 12);
    EXPECT_EQ(entries[1].action, LogAction::System);
    EXPECT_EQ(entries[1].fileName, "Copies Finished");
    EXPECT_FALSE(entries[1].size.has_value());
}

TEST_F(ExecutionJournalTest, EndIsRecordedOnce) {
    std::string id = journal_->beginExecution(plan_, Trigger::Manual, false);
    auto firstEnd = now_;
    EXPECT_TRUE(journal_->endExecution(id));

    now_ += std::chrono::hours(1);
    EXPECT_FALSE(journal_->endExecution(id));
    EXPECT_EQ(*store_->findExecution(id)->endTime, firstEnd);
}

TEST_F(ExecutionJournalTest, UnknownExecutionIsRejected) {
    EXPECT_FALSE(journal_->appendSystemEvent("missing", "Run Failed", "x"));
    EXPECT_FALSE(journal_->getLastError().empty());
    EXPECT_FALSE(journal_->endExecution("missing"));
}

TEST_F(ExecutionJournalTest, BeginFailsLoudlyWhenStoreIsUnwritable) {
    writeFile(tmp_.sub("journal/executions.json"), 3, '[');
    JsonJournalStore broken(tmp_.sub("journal"));
    ExecutionJournal journal(broken);

    EXPECT_THROW(journal.beginExecution(plan_, Trigger::Manual, false), PersistenceError);
}

class LogRetentionTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<JsonJournalStore>(tmp_.sub("journal"));
    }

    TempDir tmp_;
    std::unique_ptr<JsonJournalStore> store_;
};

TEST_F(LogRetentionTest, CutoffIsMidnightMonthsBack) {
    LogRetention retention(*store_, 3);
    EXPECT_EQ(retention.cutoff(at("2024-05-20T15:45:10Z")), at("2024-02-20T00:00:00Z"));
    // day clamped to the shorter month
    EXPECT_EQ(retention.cutoff(at("2024-05-31T01:00:00Z")), at("2024-02-29T00:00:00Z"));
    LogRetention yearly(*store_, 12);
    EXPECT_EQ(yearly.cutoff(at("2024-01-10T12:00:00Z")), at("2023-01-10T00:00:00Z"));
}

TEST_F(LogRetentionTest, PurgeRemovesOldExecutions) {
    store_->insertExecution(makeExecution("ancient", "p1", "2023-12-01T10:00:00Z"));
    store_->insertExecution(makeExecution("fresh", "p1", "2024-05-01T10:00:00Z"));
    store_->appendLogEntry(makeEntry("ancient", LogAction::Copy, "2023-12-01T10:01:00Z"));

    LogRetention retention(*store_, 3);
    EXPECT_EQ(retention.purge(at("2024-05-20T12:00:00Z")), 1u);
    EXPECT_EQ(store_->listExecutions("").size(), 1u);
    EXPECT_TRUE(store_->listLogEntries("ancient", LogQuery()).empty());
}

TEST_F(LogRetentionTest, ZeroMonthsDisablesPurge) {
    store_->insertExecution(makeExecution("ancient", "p1", "2000-01-01T10:00:00Z"));

    LogRetention retention(*store_, 0);
    EXPECT_FALSE(retention.enabled());
    EXPECT_EQ(retention.purge(at("2024-05-20T12:00:00Z")), 0u);
    EXPECT_EQ(store_->listExecutions("").size(), 1u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
