#include "Pow.hpp"
#include "Crypto.hpp"

#include <fmt/format.h>

constexpr const size_t POW_CHALLENGE_BYTES = 16;

SPowChallenge NPow::issue(int difficulty, std::chrono::seconds ttl) {
    return SPowChallenge{
        .challenge  = NCrypto::randomHex(POW_CHALLENGE_BYTES),
        .difficulty = difficulty,
        .expiresAt  = std::chrono::system_clock::now() + ttl,
    };
}

std::string NPow::digestFor(const std::string& challenge, const std::string& nonce) {
    return NCrypto::sha256(fmt::format("{}:{}", challenge, nonce));
}

size_t NPow::leadingZeroDigits(const std::string& hex) {
    size_t i = 0;
    while (i < hex.size() && hex.at(i) == '0')
        ++i;
    return i;
}

ePowResult NPow::verify(const SPowChallenge& challenge, const std::string& nonce, std::chrono::system_clock::time_point now) {
    if (now > challenge.expiresAt)
        return POW_EXPIRED;

    const auto SHA = digestFor(challenge.challenge, nonce);

    // empty digest means openssl failed, never let that pass
    if (SHA.empty() || challenge.difficulty < 0)
        return POW_INSUFFICIENT_DIFFICULTY;

    if (leadingZeroDigits(SHA) < (size_t)challenge.difficulty)
        return POW_INSUFFICIENT_DIFFICULTY;

    return POW_OK;
}
