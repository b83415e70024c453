#include "UrlUtils.hpp"

static bool isUnreserved(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string NUrlUtils::encodePathSegment(const std::string& segment) {
    static const char HEX[] = "0123456789ABCDEF";

    std::string       out;
    out.reserve(segment.size());

    for (unsigned char c : segment) {
        if (isUnreserved(c)) {
            out.push_back((char)c);
            continue;
        }

        out.push_back('%');
        out.push_back(HEX[(c >> 4) & 0xF]);
        out.push_back(HEX[c & 0xF]);
    }

    return out;
}

std::expected<std::string, std::string> NUrlUtils::decodePath(const std::string& path) {
    std::string out;
    out.reserve(path.size());

    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] != '%') {
            out.push_back(path[i]);
            continue;
        }

        if (i + 2 >= path.size())
            return std::unexpected("Truncated escape");

        const int HI = hexValue(path[i + 1]), LO = hexValue(path[i + 2]);
        if (HI < 0 || LO < 0)
            return std::unexpected("Bad escape");

        const char C = (char)((HI << 4) | LO);

        // %00 would cut the path short in any C api
        if (C == '\0')
            return std::unexpected("Null byte");

        out.push_back(C);
        i += 2;
    }

    return out;
}
