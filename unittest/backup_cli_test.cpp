#include <gtest/gtest.h>
#include "backup/backup_cli.hpp"
#include "common/service_config.hpp"
#include "store/json_config_store.hpp"
#include "test_support.hpp"

using namespace testsupport;

class BackupCLITest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.dataDir = tmp_.str();
        cli_ = std::make_unique<BackupCLI>(config_);
    }

    std::string outstandingCode() const {
        JsonConfigStore store(config_.configStorePath());
        auto codes = store.listPairingCodes();
        return codes.empty() ? std::string() : codes.front().code;
    }

    std::string storedToken() const {
        JsonConfigStore store(config_.configStorePath());
        auto token = store.loadToken();
        return token ? token->token : std::string();
    }

    TempDir tmp_;
    ServiceConfig config_;
    std::unique_ptr<BackupCLI> cli_;
};

// Test the agent side of the pairing exchange end to end
TEST_F(BackupCLITest, RedeemCodeIssuesTokenOnce) {
    ASSERT_EQ(cli_->run({"pairing-code"}), 0);
    std::string code = outstandingCode();
    ASSERT_EQ(code.size(), 6u);

    EXPECT_EQ(cli_->run({"redeem-code", code}), 0);
    std::string token = storedToken();
    EXPECT_FALSE(token.empty());
    EXPECT_TRUE(outstandingCode().empty());

    EXPECT_EQ(cli_->run({"redeem-code", code}), 1);
    EXPECT_EQ(storedToken(), token);
}

TEST_F(BackupCLITest, UnknownCodeIsRejected) {
    ASSERT_EQ(cli_->run({"pairing-code"}), 0);
    std::string wrong = outstandingCode() == "000000" ? "111111" : "000000";

    EXPECT_EQ(cli_->run({"redeem-code", wrong}), 1);
    EXPECT_TRUE(storedToken().empty());
}

TEST_F(BackupCLITest, CheckToken) {
    ASSERT_EQ(cli_->run({"pairing-code"}), 0);
    ASSERT_EQ(cli_->run({"redeem-code", outstandingCode()}), 0);
    std::string token = storedToken();

    EXPECT_EQ(cli_->run({"check-token", token}), 0);
    EXPECT_EQ(cli_->run({"check-token", token + "0"}), 1);
    EXPECT_EQ(cli_->run({"check-token", ""}), 1);

    ASSERT_EQ(cli_->run({"unpair"}), 0);
    EXPECT_EQ(cli_->run({"check-token", token}), 1);
}

TEST_F(BackupCLITest, MissingArgumentsAreUsageErrors) {
    EXPECT_EQ(cli_->run({"redeem-code"}), 1);
    EXPECT_EQ(cli_->run({"check-token"}), 1);
    EXPECT_EQ(cli_->run({"no-such-command"}), 1);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
