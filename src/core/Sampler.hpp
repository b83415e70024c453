#pragma once

#include <string>
#include <vector>
#include <set>
#include <random>
#include <expected>
#include <functional>
#include <cstdint>

#include "Catalog.hpp"
#include "CaptchaTypes.hpp"
#include "CaptchaSettings.hpp"

enum eSampleQuality : uint8_t {
    SAMPLE_NORMAL = 0,
    SAMPLE_TARGET_FILL, // not enough distractors, unselected target images fill the gap
    SAMPLE_SHORT_GRID,  // not even the target fallback could fill the grid
};

struct SGridSlot {
    std::string id;
    std::string category;
    std::string image;
    bool        correct = false;
};

struct SSampledGrid {
    std::vector<SGridSlot> slots; // display order
    std::set<std::string>  correctIds;
    std::string            targetCategory;
    std::string            label;
    size_t                 selectCount = 0;
    eSampleQuality         quality     = SAMPLE_NORMAL;
};

namespace NSampler {
    using IdGenerator = std::function<std::string()>;

    /*
        Picks a target category and `selectCount` of its images, then fills the
        grid with images from other categories. Categories are deduplicated and
        empty ones ignored. Only fails when no category has an image.
    */
    std::expected<SSampledGrid, eCaptchaError> sample(const CategoryCatalog& catalog, const SSamplerBounds& bounds, std::mt19937_64& rng, const IdGenerator& nextId);

    const char*                                 qualityToString(eSampleQuality q);
};
