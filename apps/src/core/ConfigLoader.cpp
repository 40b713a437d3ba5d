#include "ConfigLoader.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <spdlog/spdlog.h>

namespace SweepLight {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.push_back(fs::path(explicitConfigDir_.value()));
    }

    if (const char* envDir = std::getenv("SWEEPLIGHT_CONFIG_DIR"); envDir != nullptr && *envDir) {
        paths.push_back(fs::path(envDir));
    }

    paths.push_back(fs::current_path() / "config");

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "sweeplight");
    }

    paths.push_back(fs::path("/etc/sweeplight"));

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;
    std::error_code ec;

    // Explicit paths (e.g. from the command line) bypass the search.
    const fs::path direct(filename);
    if (direct.has_parent_path() && fs::is_regular_file(direct, ec)) {
        return direct;
    }

    for (const auto& dir : getSearchPaths()) {
        const fs::path localPath = dir / (filename + ".local");
        if (fs::is_regular_file(localPath, ec)) {
            return localPath;
        }

        const fs::path basePath = dir / filename;
        if (fs::is_regular_file(basePath, ec)) {
            return basePath;
        }
    }

    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::tryLoadJson(const std::filesystem::path& path)
{
    using JsonResult = Result<nlohmann::json, std::string>;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        const std::string error = "Cannot open config file: " + path.string();
        spdlog::warn("ConfigLoader: {}", error);
        return JsonResult::error(error);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    const std::string text = contents.str();
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        const std::string error = "Empty config file: " + path.string();
        spdlog::warn("ConfigLoader: {}", error);
        return JsonResult::error(error);
    }

    // Parse without exceptions so a bad file is reported, not thrown.
    nlohmann::json config = nlohmann::json::parse(text, nullptr, false);
    if (config.is_discarded()) {
        const std::string error = "Parse error in " + path.string();
        spdlog::error("ConfigLoader: {}", error);
        return JsonResult::error(error);
    }

    // Light, scene and logging configs are all keyed objects.
    if (!config.is_object()) {
        const std::string error =
            "Config root in " + path.string() + " is " + config.type_name() + ", expected object";
        spdlog::error("ConfigLoader: {}", error);
        return JsonResult::error(error);
    }

    return JsonResult::okay(std::move(config));
}

Result<nlohmann::json, std::string> ConfigLoader::loadJson(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        std::string searched;
        for (const auto& dir : getSearchPaths()) {
            searched += searched.empty() ? dir.string() : ", " + dir.string();
        }
        const std::string error = "Config file not found: " + filename + " (searched " + searched + ")";
        spdlog::debug("ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    spdlog::info("ConfigLoader: Loading {}", path->string());
    return tryLoadJson(path.value());
}

} // namespace SweepLight
