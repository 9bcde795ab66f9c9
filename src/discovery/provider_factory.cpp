#include "discovery/provider_factory.hpp"

#include "spdlog/spdlog.h"

AutoDiscovery::AutoDiscovery(std::unique_ptr<StaticListDiscovery> fileSource, std::unique_ptr<IDiscoveryProvider> fallback)
    : fileSource(std::move(fileSource)), fallback(std::move(fallback)) {}

std::string AutoDiscovery::describe() const {
    return fileSource->describe() + ", else " + fallback->describe();
}

std::optional<std::vector<ServerRef>> AutoDiscovery::discover() {
    if (fileSource->available()) {
        if (auto servers = fileSource->discover()) {
            return servers;
        }
        spdlog::info("Falling back to {}", fallback->describe());
    } else {
        spdlog::info("{} not found, using {}", fileSource->describe(), fallback->describe());
    }
    return fallback->discover();
}

std::unique_ptr<IDiscoveryProvider> CreateDiscoveryProvider(const DiscoveryOptions &options) {
    if (options.source == "file") {
        return std::make_unique<StaticListDiscovery>(options.file);
    }
    if (options.source == "steam") {
        return std::make_unique<SteamDirectoryDiscovery>(options.steam);
    }
    if (options.source == "auto") {
        return std::make_unique<AutoDiscovery>(std::make_unique<StaticListDiscovery>(options.file),
                                               std::make_unique<SteamDirectoryDiscovery>(options.steam));
    }
    spdlog::error("Unknown discovery source '{}'", options.source);
    return nullptr;
}
