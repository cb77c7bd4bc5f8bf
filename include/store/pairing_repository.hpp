#pragma once

#include "pairing/pairing_types.hpp"
#include <optional>
#include <vector>

// Local pairing state of this host: outstanding codes and the issued token.
class PairingRepository {
public:
    virtual ~PairingRepository() = default;

    virtual std::vector<PairingCode> listPairingCodes() const = 0;
    virtual void replacePairingCodes(const std::vector<PairingCode>& codes) = 0;

    virtual std::optional<AgentToken> loadToken() const = 0;
    // nullopt clears the token.
    virtual void storeToken(const std::optional<AgentToken>& token) = 0;
};
