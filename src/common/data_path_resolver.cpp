#include "common/data_path_resolver.hpp"

#include <array>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

#include <limits.h>
#include <unistd.h>

namespace {

constexpr const char *kDataDirEnvVar = "STATUSBOARD_DATA_DIR";

std::filesystem::path TryCanonical(const std::filesystem::path &path) {
    std::error_code ec;
    auto result = std::filesystem::weakly_canonical(path, ec);
    if (!ec) {
        return result;
    }

    result = std::filesystem::absolute(path, ec);
    if (!ec) {
        return result;
    }

    return path;
}

std::filesystem::path ExecutableDirectory() {
    std::array<char, PATH_MAX> buffer{};
    const ssize_t length = ::readlink("/proc/self/exe", buffer.data(), buffer.size());
    if (length <= 0 || static_cast<size_t>(length) >= buffer.size()) {
        return std::filesystem::current_path();
    }
    return TryCanonical(std::filesystem::path(buffer.data(), buffer.data() + length)).parent_path();
}

std::mutex g_dataRootMutex;
std::optional<std::filesystem::path> g_dataRootOverride;
bool g_dataRootInitialized = false;

bool IsDataRoot(const std::filesystem::path &candidate) {
    std::error_code ec;
    const auto config = candidate / "config.json";
    return std::filesystem::is_directory(candidate, ec) && std::filesystem::is_regular_file(config, ec);
}

std::filesystem::path ValidateDataRootCandidate(const std::filesystem::path &path) {
    const auto canonical = TryCanonical(path);
    if (!IsDataRoot(canonical)) {
        throw std::runtime_error("Invalid data directory: " + canonical.string() + "\n" +
                                 (canonical / "config.json").string() + " does not exist.");
    }
    return canonical;
}

std::filesystem::path DetectDataRoot(const std::optional<std::filesystem::path> &overridePath) {
    if (overridePath) {
        return ValidateDataRootCandidate(*overridePath);
    }

    if (const char *envDataDir = std::getenv(kDataDirEnvVar); envDataDir && *envDataDir != '\0') {
        return ValidateDataRootCandidate(envDataDir);
    }

    const std::array<std::filesystem::path, 2> candidates = {
        ExecutableDirectory() / "data",
        std::filesystem::current_path() / "data"
    };
    for (const auto &candidate : candidates) {
        if (IsDataRoot(candidate)) {
            return TryCanonical(candidate);
        }
    }

    throw std::runtime_error(std::string("Unable to locate the data directory; pass --data-dir or set ") + kDataDirEnvVar);
}

struct ConfigCacheState {
    std::mutex mutex;
    bool initialized = false;
    std::vector<statusboard::data::ConfigLayer> layers;
    statusboard::json::Value merged = statusboard::json::Object();
    std::unordered_map<std::string, std::size_t> labelIndex;
};

ConfigCacheState g_configCache;

const statusboard::json::Value *ResolveConfigPath(const statusboard::json::Value &root, const std::string &path) {
    if (path.empty()) {
        return &root;
    }

    const statusboard::json::Value *current = &root;
    std::size_t position = 0;

    while (position < path.size()) {
        const std::size_t dot = path.find('.', position);
        const bool lastSegment = (dot == std::string::npos);
        const std::string segment = path.substr(position, lastSegment ? std::string::npos : dot - position);
        if (segment.empty()) {
            return nullptr;
        }

        std::string key = segment;
        std::optional<std::size_t> arrayIndex;
        const auto bracketPos = segment.find('[');
        if (bracketPos != std::string::npos) {
            key = segment.substr(0, bracketPos);
            const auto closingPos = segment.find(']', bracketPos);
            if (closingPos == std::string::npos || closingPos != segment.size() - 1) {
                return nullptr;
            }

            const std::string indexText = segment.substr(bracketPos + 1, closingPos - bracketPos - 1);
            if (indexText.empty()) {
                return nullptr;
            }

            try {
                arrayIndex = static_cast<std::size_t>(std::stoul(indexText));
            } catch (const std::exception &) {
                return nullptr;
            }
        }

        if (!key.empty()) {
            if (!current->is_object()) {
                return nullptr;
            }

            const auto it = current->find(key);
            if (it == current->end()) {
                return nullptr;
            }

            current = &(*it);
        }

        if (arrayIndex.has_value()) {
            if (!current->is_array() || *arrayIndex >= current->size()) {
                return nullptr;
            }

            current = &((*current)[*arrayIndex]);
        }

        if (lastSegment) {
            break;
        }

        position = dot + 1;
    }

    return current;
}

void RebuildMergedLocked() {
    g_configCache.merged = statusboard::json::Object();
    for (const auto &layer : g_configCache.layers) {
        statusboard::data::MergeJsonObjects(g_configCache.merged, layer.json);
    }
}

} // namespace

namespace statusboard::data {

const std::filesystem::path &DataRoot() {
    static std::once_flag initFlag;
    static std::filesystem::path root;

    std::call_once(initFlag, [] {
        std::optional<std::filesystem::path> overrideCopy;
        {
            std::lock_guard<std::mutex> lock(g_dataRootMutex);
            overrideCopy = g_dataRootOverride;
        }

        root = DetectDataRoot(overrideCopy);

        std::lock_guard<std::mutex> lock(g_dataRootMutex);
        g_dataRootInitialized = true;
    });

    return root;
}

void SetDataRootOverride(const std::filesystem::path &path) {
    std::lock_guard<std::mutex> lock(g_dataRootMutex);
    if (g_dataRootInitialized) {
        throw std::runtime_error("data_path_resolver: Data root already initialized; override must be set earlier");
    }

    g_dataRootOverride = ValidateDataRootCandidate(path);
}

std::filesystem::path Resolve(const std::filesystem::path &relativePath) {
    if (relativePath.is_absolute()) {
        return TryCanonical(relativePath);
    }

    return TryCanonical(DataRoot() / relativePath);
}

std::optional<statusboard::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                                     const std::string &label,
                                                     spdlog::level::level_enum missingLevel) {
    if (!std::filesystem::exists(path)) {
        spdlog::log(missingLevel, "data_path_resolver: {} not found: {}", label, path.string());
        return std::nullopt;
    }

    std::ifstream stream(path);
    if (!stream) {
        spdlog::error("data_path_resolver: Failed to open {}: {}", label, path.string());
        return std::nullopt;
    }

    try {
        statusboard::json::Value json;
        stream >> json;
        return json;
    } catch (const std::exception &e) {
        spdlog::error("data_path_resolver: Failed to parse {}: {}", label, e.what());
        return std::nullopt;
    }
}

std::vector<ConfigLayer> LoadConfigLayers(const std::vector<ConfigLayerSpec> &specs) {
    std::vector<ConfigLayer> layers;
    layers.reserve(specs.size());

    for (const auto &spec : specs) {
        const auto absolutePath = Resolve(spec.relativePath);
        const std::string label = spec.label.empty() ? spec.relativePath.string() : spec.label;
        auto jsonOpt = LoadJsonFile(absolutePath, label, spec.missingLevel);
        if (!jsonOpt) {
            if (spec.required) {
                spdlog::error("data_path_resolver: Required config missing: {}", absolutePath.string());
            }
            continue;
        }

        if (!jsonOpt->is_object()) {
            spdlog::warn("data_path_resolver: Config {} is not a JSON object, skipping", absolutePath.string());
            continue;
        }

        layers.push_back({std::move(*jsonOpt), absolutePath.parent_path(), label});
    }

    return layers;
}

void MergeJsonObjects(statusboard::json::Value &destination, const statusboard::json::Value &source) {
    if (!destination.is_object() || !source.is_object()) {
        destination = source;
        return;
    }

    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto &key = it.key();
        const auto &value = it.value();

        if (value.is_object() && destination.contains(key) && destination[key].is_object()) {
            MergeJsonObjects(destination[key], value);
        } else {
            destination[key] = value;
        }
    }
}

bool InitializeConfigCache(const std::vector<ConfigLayerSpec> &specs) {
    std::vector<ConfigLayer> layers = LoadConfigLayers(specs);

    bool requiredPresent = true;
    for (const auto &spec : specs) {
        if (!spec.required) {
            continue;
        }
        const std::string label = spec.label.empty() ? spec.relativePath.string() : spec.label;
        bool found = false;
        for (const auto &layer : layers) {
            if (layer.label == label) {
                found = true;
                break;
            }
        }
        requiredPresent = requiredPresent && found;
    }

    std::unordered_map<std::string, std::size_t> labelIndex;
    labelIndex.reserve(layers.size());
    for (std::size_t i = 0; i < layers.size(); ++i) {
        if (!layers[i].label.empty()) {
            labelIndex[layers[i].label] = i;
        }
    }

    std::lock_guard<std::mutex> lock(g_configCache.mutex);
    g_configCache.layers = std::move(layers);
    g_configCache.labelIndex = std::move(labelIndex);
    RebuildMergedLocked();
    g_configCache.initialized = true;
    return requiredPresent;
}

bool MergeConfigLayer(const std::string &label,
                      const statusboard::json::Value &layerJson,
                      const std::filesystem::path &baseDir) {
    const std::filesystem::path canonicalBase = TryCanonical(baseDir);
    const std::string resolvedLabel = label.empty() ? canonicalBase.string() : label;

    if (!layerJson.is_object()) {
        spdlog::warn("data_path_resolver: Config layer '{}' ignored because it is not a JSON object", resolvedLabel);
        return false;
    }

    std::lock_guard<std::mutex> lock(g_configCache.mutex);
    if (!g_configCache.initialized) {
        spdlog::warn("data_path_resolver: Config cache not initialized; cannot merge layer '{}'", resolvedLabel);
        return false;
    }

    ConfigLayer newLayer{layerJson, canonicalBase, resolvedLabel};

    auto labelIt = g_configCache.labelIndex.find(resolvedLabel);
    if (labelIt != g_configCache.labelIndex.end()) {
        g_configCache.layers[labelIt->second] = std::move(newLayer);
    } else {
        g_configCache.labelIndex[resolvedLabel] = g_configCache.layers.size();
        g_configCache.layers.push_back(std::move(newLayer));
    }

    RebuildMergedLocked();

    spdlog::debug("data_path_resolver: Merged config layer '{}' from {}", resolvedLabel, canonicalBase.string());
    return true;
}

std::optional<statusboard::json::Value> ConfigValue(const std::string &path) {
    std::lock_guard<std::mutex> lock(g_configCache.mutex);
    if (!g_configCache.initialized) {
        return std::nullopt;
    }

    const auto *value = ResolveConfigPath(g_configCache.merged, path);
    if (!value) {
        return std::nullopt;
    }
    return *value;
}

std::optional<std::string> ConfigValueString(const std::string &path) {
    const auto value = ConfigValue(path);
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

std::optional<long long> ConfigValueInt(const std::string &path) {
    const auto value = ConfigValue(path);
    if (!value) {
        return std::nullopt;
    }

    if (value->is_number_integer()) {
        return value->get<long long>();
    }

    if (value->is_number_float()) {
        const double number = value->get<double>();
        if (!std::isfinite(number)
            || number < static_cast<double>(std::numeric_limits<long long>::min())
            || number >= static_cast<double>(std::numeric_limits<long long>::max())) {
            return std::nullopt;
        }
        return static_cast<long long>(number);
    }

    if (value->is_string()) {
        try {
            return std::stoll(value->get<std::string>());
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }

    return std::nullopt;
}

} // namespace statusboard::data
