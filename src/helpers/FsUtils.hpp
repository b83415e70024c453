#pragma once

#include <string>
#include <expected>

namespace NFsUtils {
    bool                                    isAbsolute(const std::string& path);
    std::string                             absolutePath(const std::string& path);
    std::expected<std::string, std::string> readFileAsString(const std::string& path);
    std::string                             htmlPath(const std::string& resource);
    std::string                             imagesRoot();

    // canonical path of `resource` under `root`, or an error if it is missing or escapes root
    std::expected<std::string, std::string> resolveUnder(const std::string& root, const std::string& resource);
};
