#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace SweepLight {

/**
 * @brief Loads JSON configuration files with multi-path search and .local override support.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. $SWEEPLIGHT_CONFIG_DIR (if set)
 * 3. ./config/ (CWD - for development)
 * 4. ~/.config/sweeplight/ (user overrides)
 * 5. /etc/sweeplight/ (system defaults)
 *
 * At each location, checks for .local version first (e.g., light.json.local),
 * then falls back to base file (e.g., light.json). The .local file is a complete
 * replacement, not a merge. A filename that is already an existing path is used as-is.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // Like load(), but a file that exists nowhere yields the fallback. A file that exists and
    // fails to parse is still an error.
    template <typename T>
    static Result<T, std::string> loadOr(const std::string& filename, const T& fallback);

    static Result<nlohmann::json, std::string> loadJson(const std::string& filename);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> tryLoadJson(const std::filesystem::path& path);
};

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto jsonResult = loadJson(filename);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }

    try {
        T config;
        // Unqualified call so ADL finds the type's own from_json.
        from_json(jsonResult.value(), config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + filename + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOr(const std::string& filename, const T& fallback)
{
    if (!findConfigFile(filename).has_value()) {
        return Result<T, std::string>::okay(fallback);
    }
    return load<T>(filename);
}

} // namespace SweepLight
