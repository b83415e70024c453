#include "Config.hpp"

#include <glaze/glaze.hpp>

#include "../helpers/FsUtils.hpp"

#include "../debug/log.hpp"

CConfig::CConfig(const std::string& path) {
    const auto RAW = NFsUtils::readFileAsString(path);

    if (!RAW.has_value())
        Debug::die("No config at {}", path);

    auto json = glz::read_jsonc<SConfig>(RAW.value());

    if (!json.has_value())
        Debug::die("Config {} has bad format: {}", path, glz::format_error(json.error(), RAW.value()));

    m_config = json.value();

    if (m_config.pow_difficulty < 0)
        Debug::die("pow_difficulty has to be >= 0, got {}", m_config.pow_difficulty);

    if (m_config.pow_difficulty > 64)
        Debug::log(WARN, "pow_difficulty {} is above the 64 digits of a sha256, no challenge will ever be solved", m_config.pow_difficulty);

    if (m_config.pow_ttl_seconds <= 0)
        Debug::die("pow_ttl_seconds has to be > 0, got {}", m_config.pow_ttl_seconds);

    if (m_config.grid_size < 1)
        Debug::die("grid_size has to be >= 1, got {}", m_config.grid_size);

    if (m_config.min_correct < 1 || m_config.min_correct > m_config.max_correct)
        Debug::die("Invalid correct bounds: min_correct {} max_correct {}", m_config.min_correct, m_config.max_correct);

    if (m_config.reap_interval_seconds <= 0)
        Debug::die("reap_interval_seconds has to be > 0, got {}", m_config.reap_interval_seconds);

    if (m_config.threads < 1)
        Debug::die("threads has to be >= 1, got {}", m_config.threads);

    RE2::Options opts;
    opts.set_case_sensitive(false);
    m_parsedConfigDatas.imagePattern = std::make_unique<re2::RE2>(m_config.image_pattern, opts);
    if (m_parsedConfigDatas.imagePattern->error_code() != RE2::NoError) {
        Debug::log(CRIT, "Regex \"{}\" failed to parse", m_config.image_pattern);
        Debug::die("Failed to parse image_pattern");
    }
}

SCaptchaSettings CConfig::captchaSettings() const {
    return SCaptchaSettings{
        .powDifficulty = m_config.pow_difficulty,
        .powTtl        = std::chrono::seconds(m_config.pow_ttl_seconds),
        .bounds =
            SSamplerBounds{
                .gridSize   = (size_t)m_config.grid_size,
                .minCorrect = (size_t)m_config.min_correct,
                .maxCorrect = (size_t)m_config.max_correct,
            },
    };
}
