#pragma once

#include <cstdint>

enum eCaptchaError : uint8_t {
    CAPTCHA_ERR_NONE = 0,
    CAPTCHA_ERR_NO_CATEGORIES,
    CAPTCHA_ERR_UNKNOWN_CHALLENGE,
    CAPTCHA_ERR_SELECTION_COUNT,
    CAPTCHA_ERR_MISSING_NONCE,
    CAPTCHA_ERR_POW_EXPIRED,
    CAPTCHA_ERR_POW_DIFFICULTY,
};

// machine-readable, stable across versions
inline const char* errorToString(eCaptchaError e) {
    switch (e) {
        case CAPTCHA_ERR_NONE: return "none";
        case CAPTCHA_ERR_NO_CATEGORIES: return "no_categories";
        case CAPTCHA_ERR_UNKNOWN_CHALLENGE: return "unknown_challenge";
        case CAPTCHA_ERR_SELECTION_COUNT: return "selection_count_mismatch";
        case CAPTCHA_ERR_MISSING_NONCE: return "missing_nonce";
        case CAPTCHA_ERR_POW_EXPIRED: return "pow_expired";
        case CAPTCHA_ERR_POW_DIFFICULTY: return "insufficient_difficulty";
    }

    return "error";
}

inline const char* errorMessage(eCaptchaError e) {
    switch (e) {
        case CAPTCHA_ERR_NONE: return "ok";
        case CAPTCHA_ERR_NO_CATEGORIES: return "No categories with images found.";
        case CAPTCHA_ERR_UNKNOWN_CHALLENGE: return "Invalid or expired captcha.";
        case CAPTCHA_ERR_SELECTION_COUNT: return "Wrong number of images selected.";
        case CAPTCHA_ERR_MISSING_NONCE: return "Missing PoW nonce.";
        case CAPTCHA_ERR_POW_EXPIRED: return "Challenge expired";
        case CAPTCHA_ERR_POW_DIFFICULTY: return "Insufficient PoW difficulty";
    }

    return "Unknown error";
}
