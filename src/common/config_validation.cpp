#include "common/config_validation.hpp"

#include "common/data_path_resolver.hpp"
#include "common/json.hpp"

#include <algorithm>

namespace {

using statusboard::config::RequiredKey;
using statusboard::config::RequiredType;

bool IsIntLike(const statusboard::json::Value& value) {
    return value.is_number_integer();
}

bool IsStringArray(const statusboard::json::Value& value) {
    if (!value.is_array()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(),
                       [](const statusboard::json::Value& entry) { return entry.is_string(); });
}

bool IsValidType(const statusboard::json::Value& value, RequiredType type) {
    switch (type) {
    case RequiredType::Int:
        return IsIntLike(value);
    case RequiredType::String:
        return value.is_string();
    case RequiredType::StringArray:
        return IsStringArray(value);
    }
    return false;
}

const char* TypeLabel(RequiredType type) {
    switch (type) {
    case RequiredType::Int:
        return "int";
    case RequiredType::String:
        return "string";
    case RequiredType::StringArray:
        return "string array";
    }
    return "unknown";
}

} // namespace

namespace statusboard::config {

std::vector<ValidationIssue> ValidateRequiredKeys(const std::vector<RequiredKey>& keys) {
    std::vector<ValidationIssue> issues;
    for (const auto& entry : keys) {
        const auto value = data::ConfigValue(entry.path);
        if (!value) {
            issues.push_back({entry.path, "missing required config"});
            continue;
        }
        if (!IsValidType(*value, entry.type)) {
            issues.push_back({entry.path, std::string("invalid type (expected ") + TypeLabel(entry.type) + ")"});
        }
    }
    return issues;
}

std::vector<RequiredKey> StatusboardRequiredKeys() {
    return {
        {"language", RequiredType::String},
        {"query.timeoutMs", RequiredType::Int},
        {"query.delayMs", RequiredType::Int},
        {"query.retries", RequiredType::Int},
        {"cycle.intervalMs", RequiredType::Int},
        {"display.minPopulation", RequiredType::Int},
        {"display.maxPopulation", RequiredType::Int},
        {"display.playerListCap", RequiredType::Int},
        {"surfaces.channels", RequiredType::StringArray},
        {"discord.apiBase", RequiredType::String},
        {"discovery.source", RequiredType::String}
    };
}

} // namespace statusboard::config
