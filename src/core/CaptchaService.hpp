#pragma once

#include <string>
#include <vector>
#include <set>
#include <mutex>
#include <random>
#include <chrono>
#include <expected>
#include <optional>
#include <functional>

#include "CaptchaTypes.hpp"
#include "CaptchaSettings.hpp"
#include "Catalog.hpp"
#include "ChallengeStore.hpp"
#include "Pow.hpp"
#include "Sampler.hpp"

struct SPowBlock {
    std::string challenge;
    int         difficulty = 0;
    std::string algo       = POW_ALGORITHM_NAME;
};

struct SIssuedImage {
    std::string id;
    std::string url;
};

struct SIssuedCaptcha {
    std::string               captcha_id;
    std::string               prompt;
    size_t                    select_count = 0;
    std::vector<SIssuedImage> images;
    SPowBlock                 pow;
};

struct SVerifyResult {
    bool          success = false;
    eCaptchaError error   = CAPTCHA_ERR_NONE;

    // filled on CAPTCHA_ERR_SELECTION_COUNT
    size_t        expectedCount = 0, submittedCount = 0;
};

struct SCaptchaStatus {
    size_t    selectCount = 0;
    SPowBlock pow;
};

/*
    Issues image puzzles bound to a PoW challenge and verifies answers.
    Each instance owns its own store, so instances never see each other's puzzles.
*/
class CCaptchaService {
  public:
    using ImageResolver = std::function<std::string(const std::string& category, const std::string& image)>;

    CCaptchaService(const SCaptchaSettings& settings);

    std::expected<SIssuedCaptcha, eCaptchaError> issue(const CategoryCatalog& catalog, const ImageResolver& resolver);

    // consumes the puzzle no matter the outcome
    SVerifyResult                  verify(const std::string& captchaId, const std::set<std::string>& selectedIds, const std::string& nonce,
                                          std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // non-destructive, does not say whether any selection is right
    std::optional<SCaptchaStatus>  check(const std::string& captchaId) const;

    size_t                         reapExpired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
    size_t                         pending() const;

    CChallengeStore&               store();
    const SCaptchaSettings&        settings() const;

  private:
    SCaptchaSettings m_settings;
    CChallengeStore  m_store;

    std::mutex       m_rngMutex;
    std::mt19937_64  m_rng;
};
