#pragma once

#include <map>
#include <string>
#include <vector>

#include <re2/re2.h>

// category name -> image identifiers
using CategoryCatalog = std::map<std::string, std::vector<std::string>>;

namespace NCatalog {
    // every subdirectory of root with at least one file fully matching pattern. Missing root gives an empty catalog.
    CategoryCatalog discover(const std::string& root, const re2::RE2& pattern);

    // "optical_cat_illusion" -> "optical cat"
    std::string displayLabel(const std::string& category);
};
