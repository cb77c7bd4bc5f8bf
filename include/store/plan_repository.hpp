#pragma once

#include "backup/backup_plan.hpp"
#include <optional>
#include <string>
#include <vector>

// Agents and plans as maintained by the operator. Writes throw PersistenceError.
class PlanRepository {
public:
    virtual ~PlanRepository() = default;

    virtual std::vector<BackupPlan> listPlans() const = 0;
    virtual std::optional<BackupPlan> findPlan(const std::string& planId) const = 0;
    virtual void savePlan(const BackupPlan& plan) = 0;
    virtual bool removePlan(const std::string& planId) = 0;

    virtual std::vector<Agent> listAgents() const = 0;
    virtual std::optional<Agent> findAgent(const std::string& agentId) const = 0;
    virtual void saveAgent(const Agent& agent) = 0;

    // Also clears agentId on every plan that referenced the agent.
    virtual bool removeAgent(const std::string& agentId) = 0;

    // nullopt clears the token. Returns false for an unknown agent.
    virtual bool updateAgentToken(const std::string& agentId,
                                  const std::optional<std::string>& token) = 0;
};
