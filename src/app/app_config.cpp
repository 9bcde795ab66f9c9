#include "app/app_config.hpp"

#include "common/config_helpers.hpp"
#include "common/data_path_resolver.hpp"
#include "common/i18n.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace {

constexpr const char *kDefaultApiBase = "https://discord.com/api/v10";

std::string envValue(const char *name) {
    const char *value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::vector<std::string> configuredChannels() {
    std::vector<std::string> channels;
    for (auto &channel : statusboard::config::ReadStringListConfig("surfaces.channels", {})) {
        if (!channel.empty()) {
            channels.push_back(std::move(channel));
        }
    }
    if (!channels.empty()) {
        return channels;
    }

    for (const char *envName : {"CHANNEL_ID_1", "CHANNEL_ID_2"}) {
        if (auto channel = envValue(envName); !channel.empty()) {
            channels.push_back(std::move(channel));
        }
    }
    return channels;
}

int requirePositive(const char *path) {
    const int value = statusboard::config::ReadRequiredIntConfig(path);
    if (value <= 0) {
        throw std::runtime_error(std::string("Config '") + path + "' must be greater than zero");
    }
    return value;
}

int requireNonNegative(const char *path) {
    const int value = statusboard::config::ReadRequiredIntConfig(path);
    if (value < 0) {
        throw std::runtime_error(std::string("Config '") + path + "' must not be negative");
    }
    return value;
}

} // namespace

DisplayStrings LoadDisplayStrings() {
    const auto &i18n = statusboard::i18n::Get();
    DisplayStrings strings;
    strings.unknownServer = i18n.get("snapshot.unknown_server");
    strings.playersHeader = i18n.get("snapshot.players_header");
    strings.playerListDisabled = i18n.get("snapshot.player_list_disabled");
    return strings;
}

std::vector<NameRewrite> LoadNameRewrites() {
    std::vector<NameRewrite> rewrites;
    const auto node = statusboard::data::ConfigValue("display.nameRewrites");
    if (!node) {
        return rewrites;
    }
    if (!node->is_array()) {
        spdlog::warn("Config 'display.nameRewrites' is not an array; ignoring it");
        return rewrites;
    }

    for (const auto &entry : *node) {
        if (!entry.is_object()) {
            continue;
        }
        NameRewrite rewrite;
        rewrite.from = entry.value("from", std::string{});
        rewrite.to = entry.value("to", std::string{});
        if (rewrite.from.empty()) {
            spdlog::warn("Config 'display.nameRewrites' entry without 'from' ignored");
            continue;
        }
        rewrites.push_back(std::move(rewrite));
    }
    return rewrites;
}

std::optional<AppSettings> LoadAppSettings() {
    AppSettings settings;

    settings.discordToken = envValue("DISCORD_TOKEN");
    if (settings.discordToken.empty()) {
        spdlog::error("DISCORD_TOKEN is not set");
        return std::nullopt;
    }

    settings.channelIds = configuredChannels();
    if (settings.channelIds.empty()) {
        spdlog::error("No channels configured; set 'surfaces.channels' or CHANNEL_ID_1/CHANNEL_ID_2");
        return std::nullopt;
    }

    try {
        settings.discordApiBase = statusboard::config::ReadStringConfig("discord.apiBase", kDefaultApiBase);
        settings.cycleInterval = std::chrono::milliseconds(requirePositive("cycle.intervalMs"));

        auto &query = settings.cycle.query;
        query.timeout = std::chrono::milliseconds(requirePositive("query.timeoutMs"));
        query.retryDelay = std::chrono::milliseconds(requireNonNegative("query.delayMs"));
        query.retries = requireNonNegative("query.retries");

        auto &snapshot = settings.cycle.snapshot;
        snapshot.queryStagger = query.retryDelay;
        snapshot.queryWorkers = static_cast<std::size_t>(
            std::clamp(statusboard::config::ReadIntConfig({"query.workers"}, 64), 1, 256));
        snapshot.minPopulation = statusboard::config::ReadRequiredIntConfig("display.minPopulation");
        snapshot.maxPopulation = statusboard::config::ReadRequiredIntConfig("display.maxPopulation");
        snapshot.playerListCap = static_cast<std::size_t>(requireNonNegative("display.playerListCap"));
        snapshot.nameRewrites = LoadNameRewrites();
        snapshot.strings = LoadDisplayStrings();
        if (snapshot.minPopulation > snapshot.maxPopulation) {
            throw std::runtime_error("Config 'display.minPopulation' exceeds 'display.maxPopulation'");
        }

        // Discord returns at most 100 messages per listing.
        settings.cycle.clearRecentLimit =
            static_cast<std::size_t>(std::clamp(statusboard::config::ReadIntConfig({"surfaces.clearRecentLimit"}, 100), 1, 100));
        settings.cycle.rediscoveryInterval =
            std::chrono::seconds(statusboard::config::ReadIntConfig({"discovery.refreshIntervalSeconds"}, 0));

        auto &discovery = settings.discovery;
        discovery.source = statusboard::config::ReadRequiredStringConfig("discovery.source");
        discovery.file = statusboard::config::ReadStringConfig("discovery.file", "servers.json");
        discovery.steam.apiKey = envValue("STEAM_API_KEY");
        discovery.steam.appId = statusboard::config::ReadIntConfig({"discovery.steam.appId"}, 686810);
        discovery.steam.nameFilter.requireAny =
            statusboard::config::ReadStringListConfig("discovery.steam.requireAny", {"GER", "GERMAN", "DEUTSCH"});
        discovery.steam.nameFilter.rejectAny =
            statusboard::config::ReadStringListConfig("discovery.steam.rejectAny", {"EVENT", "JAGER", "BADGERGROUNDS", "SWE"});
        if (discovery.source == "steam" && discovery.steam.apiKey.empty()) {
            throw std::runtime_error("STEAM_API_KEY is required when 'discovery.source' is 'steam'");
        }

        auto &logFile = settings.logFile;
        logFile.path = statusboard::config::ReadStringConfig("logging.file", "statusboard.log");
        logFile.maxFileSizeBytes =
            static_cast<std::size_t>(statusboard::config::ReadIntConfig({"logging.maxFileSizeBytes"}, 10 * 1024 * 1024));
        logFile.maxFiles = static_cast<std::size_t>(statusboard::config::ReadIntConfig({"logging.maxFiles"}, 2));
    } catch (const std::runtime_error &ex) {
        spdlog::error("{}", ex.what());
        return std::nullopt;
    }

    return settings;
}
