#pragma once

#include <string>
#include <memory>

#include <re2/re2.h>

#include "../core/CaptchaSettings.hpp"

class CConfig {
  public:
    CConfig(const std::string& path);

    struct SConfig {
        int               port             = 8000;
        int               threads          = 2;
        std::string       html_dir         = "static";
        std::string       images_dir       = "images";
        std::string       image_pattern    = R"(.*\.(png|jpe?g|webp))";
        unsigned long int max_request_size = 65536;
        bool              trace_logging    = false;

        // leading zero hex digits required in sha256(challenge:nonce).
        // Every digit multiplies the expected client work by 16: 5 means ~1M hashes.
        int               pow_difficulty  = 5;
        int               pow_ttl_seconds = 180;

        int               grid_size   = 6;
        int               min_correct = 2;
        int               max_correct = 4;

        int               reap_interval_seconds = 30;
    } m_config;

    struct {
        std::unique_ptr<re2::RE2> imagePattern;
    } m_parsedConfigDatas;

    SCaptchaSettings captchaSettings() const;
};

inline std::unique_ptr<CConfig> g_pConfig;
