#include "common/config_helpers.hpp"

#include "common/data_path_resolver.hpp"
#include "spdlog/spdlog.h"

#include <limits>
#include <stdexcept>

namespace statusboard::config {

int ReadIntConfig(std::initializer_list<const char*> paths, int defaultValue) {
    for (const char* path : paths) {
        if (!data::ConfigValue(path)) {
            continue;
        }
        if (const auto value = data::ConfigValueInt(path)) {
            if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
                spdlog::warn("Config '{}' is out of range; falling back", path);
                return defaultValue;
            }
            return static_cast<int>(*value);
        }
        spdlog::warn("Config '{}' cannot be interpreted as integer", path);
    }
    return defaultValue;
}

std::string ReadStringConfig(const char *path, const std::string &defaultValue) {
    if (const auto value = data::ConfigValue(path)) {
        if (value->is_string()) {
            return value->get<std::string>();
        }
    }
    return defaultValue;
}

std::vector<std::string> ReadStringListConfig(const char *path, const std::vector<std::string> &defaultValue) {
    const auto value = data::ConfigValue(path);
    if (!value) {
        return defaultValue;
    }
    if (!value->is_array()) {
        spdlog::warn("Config '{}' is not an array; falling back", path);
        return defaultValue;
    }

    std::vector<std::string> result;
    result.reserve(value->size());
    for (const auto &entry : *value) {
        if (entry.is_string()) {
            result.push_back(entry.get<std::string>());
        } else {
            spdlog::warn("Config '{}' contains a non-string entry; ignoring it", path);
        }
    }
    return result;
}

int ReadRequiredIntConfig(const char *path) {
    const auto value = data::ConfigValueInt(path);
    if (!value) {
        throw std::runtime_error(std::string("Missing required integer config: ") + path);
    }
    return static_cast<int>(*value);
}

std::string ReadRequiredStringConfig(const char *path) {
    const auto value = data::ConfigValueString(path);
    if (!value) {
        throw std::runtime_error(std::string("Missing required string config: ") + path);
    }
    return *value;
}

} // namespace statusboard::config
