#pragma once

#include <initializer_list>
#include <string>
#include <vector>

namespace statusboard::config {

int ReadIntConfig(std::initializer_list<const char*> paths, int defaultValue);
std::string ReadStringConfig(const char *path, const std::string &defaultValue);
std::vector<std::string> ReadStringListConfig(const char *path, const std::vector<std::string> &defaultValue);
int ReadRequiredIntConfig(const char *path);
std::string ReadRequiredStringConfig(const char *path);

} // namespace statusboard::config
