#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/json.hpp"
#include <spdlog/spdlog.h>

namespace statusboard::data {

// Resolve paths located under the runtime data directory.
std::filesystem::path Resolve(const std::filesystem::path &relativePath);

// Overrides the detected data directory. Must be called before the first Resolve/DataRoot invocation.
void SetDataRootOverride(const std::filesystem::path &path);

// Returns the detected runtime data directory.
const std::filesystem::path &DataRoot();

std::optional<statusboard::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                                     const std::string &label,
                                                     spdlog::level::level_enum missingLevel);

struct ConfigLayerSpec {
    std::filesystem::path relativePath;
    std::string label;
    spdlog::level::level_enum missingLevel = spdlog::level::warn;
    bool required = false;
};

struct ConfigLayer {
    statusboard::json::Value json;
    std::filesystem::path baseDir;
    std::string label;
};

std::vector<ConfigLayer> LoadConfigLayers(const std::vector<ConfigLayerSpec> &specs);

void MergeJsonObjects(statusboard::json::Value &destination, const statusboard::json::Value &source);

// Initializes the global configuration cache from the given config layers, lowest priority first.
// Returns false when a layer marked as required could not be loaded.
bool InitializeConfigCache(const std::vector<ConfigLayerSpec> &specs);

// Adds or replaces a named layer on top of the already initialized cache.
bool MergeConfigLayer(const std::string &label,
                      const statusboard::json::Value &layerJson,
                      const std::filesystem::path &baseDir);

// Copies a configuration value out of the merged cache using dotted path syntax.
std::optional<statusboard::json::Value> ConfigValue(const std::string &path);

// Returns the configuration value at the given path if it is a string.
std::optional<std::string> ConfigValueString(const std::string &path);

// Returns the configuration value at the given path interpreted as an integer, if possible.
std::optional<long long> ConfigValueInt(const std::string &path);

} // namespace statusboard::data
