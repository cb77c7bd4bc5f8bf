#include "pairing/agent_pairing.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include "pairing/pairing_authority.hpp"
#include <cctype>

AgentPairing::AgentPairing(PlanRepository& plans, const AgentClientOptions& options)
    : plans_(plans),
      clientFactory_([options](const std::string& address) {
          return std::make_unique<AgentRestClient>(address, "", options);
      }) {}

AgentPairing::AgentPairing(PlanRepository& plans, ClientFactory clientFactory)
    : plans_(plans), clientFactory_(std::move(clientFactory)) {}

bool AgentPairing::isWellFormedCode(const std::string& code) {
    if (code.size() != static_cast<size_t>(PairingAuthority::kCodeDigits)) {
        return false;
    }
    for (char c : code) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string AgentPairing::pair(const std::string& agentId, const std::string& code) {
    auto agent = plans_.findAgent(agentId);
    if (!agent) {
        throw ConfigurationError("Unknown agent: " + agentId);
    }
    if (agent->address.empty()) {
        throw ConfigurationError("Agent '" + agent->name + "' has no address");
    }
    if (!isWellFormedCode(code)) {
        throw AuthenticationError(AuthenticationError::Reason::InvalidCode,
                                  "Pairing code must be " +
                                  std::to_string(PairingAuthority::kCodeDigits) + " digits");
    }

    Logger::info("Pairing with agent '" + agent->name + "' at " + agent->address);
    auto client = clientFactory_(agent->address);
    std::string token = client->verifyPairingCode(code);

    if (!plans_.updateAgentToken(agentId, token)) {
        throw PersistenceError("Agent " + agentId + " disappeared while pairing");
    }
    Logger::info("Agent '" + agent->name + "' paired");
    return token;
}

bool AgentPairing::forget(const std::string& agentId) {
    if (!plans_.updateAgentToken(agentId, std::nullopt)) {
        return false;
    }
    Logger::info("Token of agent " + agentId + " cleared");
    return true;
}
