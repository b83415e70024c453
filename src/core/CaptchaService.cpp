#include "CaptchaService.hpp"
#include "Crypto.hpp"
#include "Pow.hpp"

#include "../debug/log.hpp"

#include <fmt/format.h>

constexpr const size_t CAPTCHA_ID_BYTES = 16;
constexpr const size_t IMAGE_ID_BYTES   = 16;

static std::string generateId(size_t bytes) {
    return NCrypto::randomHex(bytes);
}

CCaptchaService::CCaptchaService(const SCaptchaSettings& settings) : m_settings(settings), m_rng(std::random_device{}()) {
    ;
}

std::expected<SIssuedCaptcha, eCaptchaError> CCaptchaService::issue(const CategoryCatalog& catalog, const ImageResolver& resolver) {
    std::expected<SSampledGrid, eCaptchaError> sampled;

    {
        std::lock_guard<std::mutex> lg(m_rngMutex);
        sampled = NSampler::sample(catalog, m_settings.bounds, m_rng, [] { return generateId(IMAGE_ID_BYTES); });
    }

    if (!sampled.has_value()) {
        Debug::log(ERR, "Cannot issue a captcha: {}", errorMessage(sampled.error()));
        return std::unexpected(sampled.error());
    }

    const auto& GRID = sampled.value();

    if (GRID.quality != SAMPLE_NORMAL)
        Debug::log(WARN, "Degraded captcha ({}): category {} has {} of {} images", NSampler::qualityToString(GRID.quality), GRID.targetCategory, GRID.slots.size(),
                   m_settings.bounds.gridSize);

    const auto     POW = NPow::issue(m_settings.powDifficulty, m_settings.powTtl);

    SIssuedCaptcha captcha;
    captcha.captcha_id   = generateId(CAPTCHA_ID_BYTES);
    captcha.prompt       = fmt::format("Which images contain {}?", GRID.label);
    captcha.select_count = GRID.selectCount;
    captcha.pow          = SPowBlock{.challenge = POW.challenge, .difficulty = POW.difficulty};

    for (const auto& s : GRID.slots) {
        captcha.images.emplace_back(SIssuedImage{.id = s.id, .url = resolver(s.category, s.image)});
    }

    m_store.put(captcha.captcha_id, SPuzzleRecord{.correctIds = GRID.correctIds, .pow = POW});

    Debug::log(TRACE, "Issued captcha {}: target {}, {} to select, {} images, quality {}", captcha.captcha_id, GRID.targetCategory, GRID.selectCount, GRID.slots.size(),
               NSampler::qualityToString(GRID.quality));

    return captcha;
}

SVerifyResult CCaptchaService::verify(const std::string& captchaId, const std::set<std::string>& selectedIds, const std::string& nonce,
                                      std::chrono::system_clock::time_point now) {
    SVerifyResult result;

    const auto    RECORD = m_store.takeAndRemove(captchaId);
    if (!RECORD) {
        result.error = CAPTCHA_ERR_UNKNOWN_CHALLENGE;
        return result;
    }

    if (selectedIds.size() != RECORD->correctIds.size()) {
        result.error          = CAPTCHA_ERR_SELECTION_COUNT;
        result.expectedCount  = RECORD->correctIds.size();
        result.submittedCount = selectedIds.size();
        return result;
    }

    if (nonce.empty()) {
        result.error = CAPTCHA_ERR_MISSING_NONCE;
        return result;
    }

    switch (NPow::verify(RECORD->pow, nonce, now)) {
        case POW_EXPIRED: result.error = CAPTCHA_ERR_POW_EXPIRED; return result;
        case POW_INSUFFICIENT_DIFFICULTY: result.error = CAPTCHA_ERR_POW_DIFFICULTY; return result;
        case POW_OK: break;
    }

    result.success = selectedIds == RECORD->correctIds;

    Debug::log(TRACE, "Captcha {} verified, success: {}", captchaId, result.success);

    return result;
}

std::optional<SCaptchaStatus> CCaptchaService::check(const std::string& captchaId) const {
    const auto RECORD = m_store.peek(captchaId);
    if (!RECORD)
        return std::nullopt;

    return SCaptchaStatus{
        .selectCount = RECORD->correctIds.size(),
        .pow         = SPowBlock{.challenge = RECORD->pow.challenge, .difficulty = RECORD->pow.difficulty},
    };
}

size_t CCaptchaService::reapExpired(std::chrono::system_clock::time_point now) {
    return m_store.reapExpired(now);
}

size_t CCaptchaService::pending() const {
    return m_store.size();
}

CChallengeStore& CCaptchaService::store() {
    return m_store;
}

const SCaptchaSettings& CCaptchaService::settings() const {
    return m_settings;
}
