#pragma once

#include <chrono>
#include <cstddef>

struct SSamplerBounds {
    size_t gridSize   = 6;
    size_t minCorrect = 2;
    size_t maxCorrect = 4;
};

struct SCaptchaSettings {
    int                  powDifficulty = 5;
    std::chrono::seconds powTtl        = std::chrono::seconds(180);
    SSamplerBounds       bounds;
};
