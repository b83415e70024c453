#pragma once

#include <string>
#include <expected>

namespace NUrlUtils {
    // escapes everything outside the RFC 3986 unreserved set, '/' included
    std::string                             encodePathSegment(const std::string& segment);

    // reverses %XX escapes. '+' stays literal, this is a path and not a query
    std::expected<std::string, std::string> decodePath(const std::string& path);
};
