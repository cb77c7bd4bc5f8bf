#pragma once

#include "store/pairing_repository.hpp"
#include "store/plan_repository.hpp"
#include "common/utils.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

// config.json: {"agents": [...], "plans": [...], "pairing": {"codes": [...], "token": ...}}.
// Re-read on every access so edits made while the daemon runs are picked up on
// the next scheduler tick; every write replaces the file atomically. Access is
// serialized across processes by a flock on "<path>.lock".
class JsonConfigStore : public PlanRepository, public PairingRepository {
public:
    explicit JsonConfigStore(const std::string& path);

    std::vector<BackupPlan> listPlans() const override;
    std::optional<BackupPlan> findPlan(const std::string& planId) const override;
    void savePlan(const BackupPlan& plan) override;
    bool removePlan(const std::string& planId) override;

    std::vector<Agent> listAgents() const override;
    std::optional<Agent> findAgent(const std::string& agentId) const override;
    void saveAgent(const Agent& agent) override;
    bool removeAgent(const std::string& agentId) override;
    bool updateAgentToken(const std::string& agentId,
                          const std::optional<std::string>& token) override;

    std::vector<PairingCode> listPairingCodes() const override;
    void replacePairingCodes(const std::vector<PairingCode>& codes) override;
    std::optional<AgentToken> loadToken() const override;
    void storeToken(const std::optional<AgentToken>& token) override;

    const std::string& path() const { return path_; }

private:
    std::unique_ptr<utils::FileLock> lockStore(bool exclusive) const;
    nlohmann::json load() const;
    void save(const nlohmann::json& doc) const;

    std::string path_;
    mutable std::mutex mutex_;
};
