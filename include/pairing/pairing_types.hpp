#pragma once

#include "common/utils.hpp"
#include <string>
#include <nlohmann/json.hpp>

struct PairingCode {
    std::string code;
    utils::TimePoint createdAt{};
    utils::TimePoint expiresAt{};

    // Valid while now < expiresAt.
    bool isValidAt(utils::TimePoint now) const { return now < expiresAt; }
};

struct AgentToken {
    std::string token;
    utils::TimePoint issuedAt{};
};

enum class PairingState {
    Unpaired,
    AwaitingPairing,
    Paired
};

const char* pairingStateToString(PairingState state);

void to_json(nlohmann::json& j, const PairingCode& code);
void from_json(const nlohmann::json& j, PairingCode& code);
void to_json(nlohmann::json& j, const AgentToken& token);
void from_json(const nlohmann::json& j, AgentToken& token);
