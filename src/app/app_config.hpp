#pragma once

#include "app/update_cycle.hpp"
#include "common/logging.hpp"
#include "discovery/provider_factory.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct AppSettings {
    std::string discordToken;
    std::string discordApiBase;
    std::vector<std::string> channelIds;
    std::chrono::milliseconds cycleInterval{15000};
    DiscoveryOptions discovery;
    UpdateCycleOptions cycle;
    statusboard::logging::FileSinkOptions logFile;
};

// Localised texts used when rendering slots. Reads the active I18n table.
DisplayStrings LoadDisplayStrings();

std::vector<NameRewrite> LoadNameRewrites();

// Builds settings from the merged configuration and the environment. Logs the reason and returns
// std::nullopt when a required value is missing or invalid.
std::optional<AppSettings> LoadAppSettings();
