#pragma once

#include "pairing/pairing_types.hpp"
#include "store/pairing_repository.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

// Issues pairing codes and the bearer token they are exchanged for.
//
//   Unpaired --generate--> AwaitingPairing --redeem within TTL--> Paired
//   AwaitingPairing --TTL elapsed--> Unpaired
//   Paired --unpair--> Unpaired (a fresh code is minted immediately)
class PairingAuthority {
public:
    using Clock = std::function<utils::TimePoint()>;

    static constexpr int kCodeDigits = 6;
    static constexpr int kTokenBytes = 16;

    PairingAuthority(PairingRepository& repository, std::chrono::minutes ttl,
                     Clock clock = Clock());

    // Returns the outstanding code when one is still valid, otherwise purges
    // expired codes and mints a new one.
    PairingCode generatePairingCode();

    // Single use. Throws AuthenticationError with InvalidCode or Expired.
    std::string redeemPairingCode(const std::string& code);

    // Throws AuthenticationError(Unauthorized) unless candidate is the stored token.
    void validateToken(const std::string& candidate) const;

    // Drops the token and returns the code minted in its place.
    PairingCode unpair();

    PairingState state() const;

    std::chrono::minutes ttl() const { return ttl_; }

private:
    PairingCode mintCode(utils::TimePoint now);

    PairingRepository& repository_;
    std::chrono::minutes ttl_;
    Clock clock_;
    mutable std::mutex mutex_;
};

// Random lowercase hex string of byteCount bytes from the OpenSSL CSPRNG.
std::string randomHexToken(int byteCount);
// Zero-padded random decimal string.
std::string randomNumericCode(int digits);
