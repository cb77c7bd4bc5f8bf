#pragma once

#include "common/agent_rest_client.hpp"
#include "store/plan_repository.hpp"
#include <functional>
#include <memory>
#include <string>

// Server side of the pairing exchange: hands an operator-supplied code to the
// agent and records the token it answers with.
class AgentPairing {
public:
    using ClientFactory = std::function<std::unique_ptr<AgentRestClient>(const std::string& address)>;

    AgentPairing(PlanRepository& plans, const AgentClientOptions& options);
    AgentPairing(PlanRepository& plans, ClientFactory clientFactory);

    // Returns the new token. Throws ConfigurationError for an unknown agent or one
    // without an address, AuthenticationError when the agent rejects the code and
    // TransportError when it cannot be reached.
    std::string pair(const std::string& agentId, const std::string& code);

    // Forgets the token stored for the agent.
    bool forget(const std::string& agentId);

    static bool isWellFormedCode(const std::string& code);

private:
    PlanRepository& plans_;
    ClientFactory clientFactory_;
};
