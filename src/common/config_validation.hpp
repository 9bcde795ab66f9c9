#pragma once

#include <string>
#include <vector>

namespace statusboard::config {

enum class RequiredType {
    Int,
    String,
    StringArray
};

struct RequiredKey {
    const char* path;
    RequiredType type;
};

struct ValidationIssue {
    std::string path;
    std::string message;
};

std::vector<ValidationIssue> ValidateRequiredKeys(const std::vector<RequiredKey>& keys);

std::vector<RequiredKey> StatusboardRequiredKeys();

} // namespace statusboard::config
