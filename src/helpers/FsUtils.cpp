#include "FsUtils.hpp"

#include <fstream>
#include <filesystem>

#include "../GlobalState.hpp"
#include "../config/Config.hpp"

bool NFsUtils::isAbsolute(const std::string& sv) {
    return sv.size() > 0 && (*sv.begin() == '/' || *sv.begin() == '~');
}

std::string NFsUtils::absolutePath(const std::string& path) {
    return isAbsolute(path) ? path : g_pGlobalState->cwd + "/" + path;
}

std::expected<std::string, std::string> NFsUtils::readFileAsString(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good())
        return std::unexpected("No file");
    return std::string((std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>()));
}

std::string NFsUtils::htmlPath(const std::string& resource) {
    static const std::string htmlRoot = absolutePath(g_pConfig->m_config.html_dir);
    return htmlRoot + "/" + resource;
}

std::string NFsUtils::imagesRoot() {
    static const std::string imagesRoot = absolutePath(g_pConfig->m_config.images_dir);
    return imagesRoot;
}

std::expected<std::string, std::string> NFsUtils::resolveUnder(const std::string& root, const std::string& resource) {
    std::error_code ec;
    const auto      ROOT = std::filesystem::canonical(root, ec);

    if (ec)
        return std::unexpected("Bad root");

    const auto PATH = std::filesystem::canonical(ROOT / resource, ec);

    if (ec)
        return std::unexpected("No file");

    // directory traversal
    if (!PATH.string().starts_with(ROOT.string() + "/"))
        return std::unexpected("Outside of root");

    if (!std::filesystem::is_regular_file(PATH, ec))
        return std::unexpected("Not a file");

    return PATH.string();
}
