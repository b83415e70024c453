#include "Catalog.hpp"

#include "../debug/log.hpp"

#include <filesystem>
#include <algorithm>
#include <string_view>

constexpr const char* CATEGORY_SUFFIX = "_illusion";

CategoryCatalog NCatalog::discover(const std::string& root, const re2::RE2& pattern) {
    CategoryCatalog catalog;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec))
        return catalog;

    for (const auto& dir : std::filesystem::directory_iterator(root, ec)) {
        std::error_code dirEc;
        if (!dir.is_directory(dirEc))
            continue;

        std::vector<std::string> files;

        for (const auto& f : std::filesystem::directory_iterator(dir.path(), dirEc)) {
            if (!f.is_regular_file(dirEc))
                continue;

            const auto NAME = f.path().filename().string();
            if (!RE2::FullMatch(NAME, pattern))
                continue;

            files.emplace_back(NAME);
        }

        if (dirEc) {
            Debug::log(WARN, "NCatalog::discover: failed to list {}: {}", dir.path().string(), dirEc.message());
            continue;
        }

        if (files.empty())
            continue;

        std::sort(files.begin(), files.end());
        catalog.emplace(dir.path().filename().string(), std::move(files));
    }

    if (ec)
        Debug::log(WARN, "NCatalog::discover: failed to list {}: {}", root, ec.message());

    Debug::log(TRACE, "NCatalog::discover: {} categories under {}", catalog.size(), root);

    return catalog;
}

std::string NCatalog::displayLabel(const std::string& category) {
    std::string label = category;

    size_t      pos = 0;
    while ((pos = label.find(CATEGORY_SUFFIX, pos)) != std::string::npos) {
        label.erase(pos, std::string_view{CATEGORY_SUFFIX}.size());
    }

    std::replace(label.begin(), label.end(), '_', ' ');

    return label;
}
