#pragma once

#include "discovery/static_list_discovery.hpp"
#include "discovery/steam_directory_discovery.hpp"

#include <filesystem>
#include <memory>
#include <string>

struct DiscoveryOptions {
    // "auto", "file" or "steam".
    std::string source = "auto";
    std::filesystem::path file = "servers.json";
    SteamDirectoryOptions steam;
};

// Tries the static list first and falls back to the Steam directory when the file is missing or unreadable.
class AutoDiscovery : public IDiscoveryProvider {
public:
    AutoDiscovery(std::unique_ptr<StaticListDiscovery> fileSource, std::unique_ptr<IDiscoveryProvider> fallback);

    std::optional<std::vector<ServerRef>> discover() override;
    std::string describe() const override;

private:
    std::unique_ptr<StaticListDiscovery> fileSource;
    std::unique_ptr<IDiscoveryProvider> fallback;
};

// Returns nullptr for an unknown source name.
std::unique_ptr<IDiscoveryProvider> CreateDiscoveryProvider(const DiscoveryOptions &options);
