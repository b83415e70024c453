#pragma once

#include <string>
#include <chrono>
#include <cstdint>

constexpr const char* POW_ALGORITHM_NAME = "sha256-prefix-zeros";

struct SPowChallenge {
    std::string                           challenge;
    int                                   difficulty = 0;
    std::chrono::system_clock::time_point expiresAt;
};

enum ePowResult : uint8_t {
    POW_OK = 0,
    POW_EXPIRED,
    POW_INSUFFICIENT_DIFFICULTY,
};

/*
    Hash puzzle: sha256(challenge + ":" + nonce) in hex has to start with
    `difficulty` '0' digits. Each digit is 4 bits, so a solver needs
    16^difficulty hashes on average.
*/
namespace NPow {
    SPowChallenge issue(int difficulty, std::chrono::seconds ttl);
    ePowResult    verify(const SPowChallenge& challenge, const std::string& nonce,
                         std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    std::string   digestFor(const std::string& challenge, const std::string& nonce);
    size_t        leadingZeroDigits(const std::string& hex);
};
