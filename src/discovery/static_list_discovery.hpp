#pragma once

#include "discovery/provider.hpp"

#include "common/json.hpp"

#include <filesystem>

// Reads a JSON array of {"address": "...", "port": N} records.
class StaticListDiscovery : public IDiscoveryProvider {
public:
    explicit StaticListDiscovery(std::filesystem::path path);

    std::optional<std::vector<ServerRef>> discover() override;
    std::string describe() const override;

    bool available() const;

    static std::optional<std::vector<ServerRef>> parseServerList(const statusboard::json::Value &jsonData);

private:
    std::filesystem::path path;
};
