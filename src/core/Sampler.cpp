#include "Sampler.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>
#include <utility>

struct SEligibleCategory {
    std::string              name;
    std::vector<std::string> images;
};

static std::vector<SEligibleCategory> eligibleCategories(const CategoryCatalog& catalog) {
    std::vector<SEligibleCategory> result;

    for (const auto& [name, images] : catalog) {
        SEligibleCategory               cat{.name = name};
        std::unordered_set<std::string> seen;

        for (const auto& img : images) {
            if (seen.emplace(img).second)
                cat.images.emplace_back(img);
        }

        if (cat.images.empty())
            continue;

        result.emplace_back(std::move(cat));
    }

    return result;
}

std::expected<SSampledGrid, eCaptchaError> NSampler::sample(const CategoryCatalog& catalog, const SSamplerBounds& bounds, std::mt19937_64& rng, const IdGenerator& nextId) {
    const auto CATEGORIES = eligibleCategories(catalog);

    if (CATEGORIES.empty())
        return std::unexpected(CAPTCHA_ERR_NO_CATEGORIES);

    std::uniform_int_distribution<size_t> targetDist(0, CATEGORIES.size() - 1);
    const auto&                           TARGET = CATEGORIES.at(targetDist(rng));

    const size_t                          MAX_CORRECT = std::max<size_t>(1, std::min({bounds.maxCorrect, TARGET.images.size(), bounds.gridSize}));
    const size_t                          MIN_CORRECT = std::clamp<size_t>(bounds.minCorrect, 1, MAX_CORRECT);

    std::uniform_int_distribution<size_t> countDist(MIN_CORRECT, MAX_CORRECT);
    const size_t                          SELECT_COUNT = countDist(rng);

    std::vector<std::string>              correctImages;
    std::sample(TARGET.images.begin(), TARGET.images.end(), std::back_inserter(correctImages), SELECT_COUNT, rng);

    const size_t                                     NEEDED = bounds.gridSize > SELECT_COUNT ? bounds.gridSize - SELECT_COUNT : 0;

    std::vector<std::pair<std::string, std::string>> pool;
    for (const auto& c : CATEGORIES) {
        if (c.name == TARGET.name)
            continue;

        for (const auto& img : c.images) {
            pool.emplace_back(c.name, img);
        }
    }

    SSampledGrid                                     grid;
    std::vector<std::pair<std::string, std::string>> fill;

    if (pool.size() >= NEEDED) {
        std::sample(pool.begin(), pool.end(), std::back_inserter(fill), NEEDED, rng);
        grid.quality = SAMPLE_NORMAL;
    } else {
        fill = pool;

        std::vector<std::string> leftovers;
        std::copy_if(TARGET.images.begin(), TARGET.images.end(), std::back_inserter(leftovers),
                     [&correctImages](const auto& img) { return std::find(correctImages.begin(), correctImages.end(), img) == correctImages.end(); });

        std::vector<std::string> extra;
        std::sample(leftovers.begin(), leftovers.end(), std::back_inserter(extra), NEEDED - fill.size(), rng);

        for (auto& img : extra) {
            fill.emplace_back(TARGET.name, std::move(img));
        }

        grid.quality = fill.size() == NEEDED ? SAMPLE_TARGET_FILL : SAMPLE_SHORT_GRID;
    }

    for (const auto& img : correctImages) {
        auto& slot = grid.slots.emplace_back(SGridSlot{.id = nextId(), .category = TARGET.name, .image = img, .correct = true});
        grid.correctIds.emplace(slot.id);
    }

    for (const auto& [cat, img] : fill) {
        grid.slots.emplace_back(SGridSlot{.id = nextId(), .category = cat, .image = img, .correct = false});
    }

    std::shuffle(grid.slots.begin(), grid.slots.end(), rng);

    grid.targetCategory = TARGET.name;
    grid.label          = NCatalog::displayLabel(TARGET.name);
    grid.selectCount    = correctImages.size();

    return grid;
}

const char* NSampler::qualityToString(eSampleQuality q) {
    switch (q) {
        case SAMPLE_NORMAL: return "normal";
        case SAMPLE_TARGET_FILL: return "target-fill";
        case SAMPLE_SHORT_GRID: return "short-grid";
    }

    return "error";
}
