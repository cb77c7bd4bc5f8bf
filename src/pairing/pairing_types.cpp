#include "pairing/pairing_types.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {

utils::TimePoint readTime(const json& j, const char* key) {
    auto parsed = utils::parseIso8601(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("invalid timestamp in '") + key + "'");
    }
    return *parsed;
}

} // namespace

const char* pairingStateToString(PairingState state) {
    switch (state) {
        case PairingState::Unpaired:        return "Unpaired";
        case PairingState::AwaitingPairing: return "AwaitingPairing";
        case PairingState::Paired:          return "Paired";
    }
    return "Unknown";
}

void to_json(json& j, const PairingCode& code) {
    j = json{
        {"code", code.code},
        {"createdAt", utils::formatIso8601(code.createdAt)},
        {"expiresAt", utils::formatIso8601(code.expiresAt)}
    };
}

void from_json(const json& j, PairingCode& code) {
    code.code = j.at("code").get<std::string>();
    code.createdAt = readTime(j, "createdAt");
    code.expiresAt = readTime(j, "expiresAt");
}

void to_json(json& j, const AgentToken& token) {
    j = json{
        {"token", token.token},
        {"issuedAt", utils::formatIso8601(token.issuedAt)}
    };
}

void from_json(const json& j, AgentToken& token) {
    token.token = j.at("token").get<std::string>();
    token.issuedAt = readTime(j, "issuedAt");
}
