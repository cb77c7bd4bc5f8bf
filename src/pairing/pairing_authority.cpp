#include "pairing/pairing_authority.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/rand.h>

std::string randomHexToken(int byteCount) {
    std::vector<unsigned char> bytes(static_cast<size_t>(byteCount));
    if (RAND_bytes(bytes.data(), byteCount) != 1) {
        throw BackupError("Random number generator failure");
    }
    std::ostringstream ss;
    for (unsigned char b : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

std::string randomNumericCode(int digits) {
    uint32_t modulus = 1;
    for (int i = 0; i < digits; ++i) {
        modulus *= 10;
    }
    // largest multiple of modulus that fits, to keep every code equally likely
    const uint32_t limit = UINT32_MAX - (UINT32_MAX % modulus);

    uint32_t value = 0;
    do {
        unsigned char bytes[4];
        if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
            throw BackupError("Random number generator failure");
        }
        value = (uint32_t(bytes[0]) << 24) | (uint32_t(bytes[1]) << 16) |
                (uint32_t(bytes[2]) << 8) | uint32_t(bytes[3]);
    } while (value >= limit);

    std::ostringstream ss;
    ss << std::setw(digits) << std::setfill('0') << (value % modulus);
    return ss.str();
}

PairingAuthority::PairingAuthority(PairingRepository& repository, std::chrono::minutes ttl,
                                   Clock clock)
    : repository_(repository), ttl_(ttl), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

PairingCode PairingAuthority::mintCode(utils::TimePoint now) {
    PairingCode code;
    code.code = randomNumericCode(kCodeDigits);
    code.createdAt = now;
    code.expiresAt = now + ttl_;
    repository_.replacePairingCodes({code});
    Logger::info("Generated pairing code, valid for " + std::to_string(ttl_.count()) + " minutes");
    return code;
}

PairingCode PairingAuthority::generatePairingCode() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    for (const auto& code : repository_.listPairingCodes()) {
        if (code.isValidAt(now)) {
            return code;
        }
    }
    return mintCode(now);
}

std::string PairingAuthority::redeemPairingCode(const std::string& code) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();

    std::optional<PairingCode> match;
    for (const auto& candidate : repository_.listPairingCodes()) {
        if (candidate.code == code) {
            match = candidate;
            break;
        }
    }
    if (!match) {
        Logger::warning("Pairing attempt with an unknown code");
        throw AuthenticationError(AuthenticationError::Reason::InvalidCode, "Invalid pairing code");
    }
    if (!match->isValidAt(now)) {
        Logger::warning("Pairing attempt with an expired code");
        throw AuthenticationError(AuthenticationError::Reason::Expired, "Pairing code expired");
    }

    AgentToken token;
    token.token = randomHexToken(kTokenBytes);
    token.issuedAt = now;
    repository_.storeToken(token);
    repository_.replacePairingCodes({});
    Logger::info("Pairing completed, token issued");
    return token.token;
}

void PairingAuthority::validateToken(const std::string& candidate) const {
    if (candidate.empty()) {
        throw AuthenticationError(AuthenticationError::Reason::Unauthorized, "Missing agent token");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto stored = repository_.loadToken();
    if (!stored || stored->token.size() != candidate.size() ||
        CRYPTO_memcmp(stored->token.data(), candidate.data(), candidate.size()) != 0) {
        throw AuthenticationError(AuthenticationError::Reason::Unauthorized, "Invalid agent token");
    }
}

PairingCode PairingAuthority::unpair() {
    std::lock_guard<std::mutex> lock(mutex_);
    repository_.storeToken(std::nullopt);
    Logger::info("Agent unpaired, token revoked");
    return mintCode(clock_());
}

PairingState PairingAuthority::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto token = repository_.loadToken(); token && !token->token.empty()) {
        return PairingState::Paired;
    }
    auto now = clock_();
    for (const auto& code : repository_.listPairingCodes()) {
        if (code.isValidAt(now)) {
            return PairingState::AwaitingPairing;
        }
    }
    return PairingState::Unpaired;
}
