#include "config_test.hpp"

#include "app/app_config.hpp"
#include "common/config_helpers.hpp"
#include "common/config_validation.hpp"
#include "common/data_path_resolver.hpp"
#include "common/i18n.hpp"

#include <cstdlib>
#include <filesystem>

namespace {

statusboard::json::Value defaultsLayer() {
    return statusboard::json::Parse(R"({
        "language": "en",
        "query": {"timeoutMs": 100, "delayMs": 50, "retries": 1},
        "cycle": {"intervalMs": 15000},
        "display": {
            "minPopulation": 0,
            "maxPopulation": 40,
            "playerListCap": 40,
            "nameRewrites": [{"from": "Clan!Twitch", "to": "Clan"}, {"to": "ignored"}]
        },
        "surfaces": {"channels": ["111", "222"], "clearRecentLimit": 100},
        "discord": {"apiBase": "https://discord.com/api/v10"},
        "discovery": {"source": "auto", "file": "servers.json", "steam": {"appId": 686810}}
    })");
}

} // namespace

void ConfigTest::init() {
    QVERIFY(statusboard::data::InitializeConfigCache({}));
    QVERIFY(statusboard::data::MergeConfigLayer("defaults", defaultsLayer(), std::filesystem::temp_directory_path()));
    ::setenv("DISCORD_TOKEN", "test-token", 1);
    ::unsetenv("CHANNEL_ID_1");
    ::unsetenv("CHANNEL_ID_2");
    ::unsetenv("STEAM_API_KEY");
    statusboard::i18n::Get().setStrings({});
}

void ConfigTest::test_dotted_path_lookup() {
    QCOMPARE(statusboard::config::ReadIntConfig({"query.timeoutMs"}, 0), 100);
    QCOMPARE(statusboard::config::ReadIntConfig({"query.missing", "cycle.intervalMs"}, 0), 15000);
    QCOMPARE(statusboard::config::ReadStringConfig("discovery.source", ""), std::string("auto"));
    QCOMPARE(statusboard::config::ReadStringConfig("discovery.nothing", "fallback"), std::string("fallback"));
    QVERIFY(statusboard::config::ReadStringListConfig("surfaces.channels", {}) == (std::vector<std::string>{"111", "222"}));
    QVERIFY_EXCEPTION_THROWN(statusboard::config::ReadRequiredIntConfig("query.nothing"), std::runtime_error);

    QVERIFY(statusboard::data::MergeConfigLayer(
        "user", statusboard::json::Parse(R"({"query": {"retries": 2.0, "timeoutMs": 1e300}})"), std::filesystem::temp_directory_path()));
    QCOMPARE(statusboard::config::ReadIntConfig({"query.retries"}, 0), 2);
    QCOMPARE(statusboard::config::ReadIntConfig({"query.timeoutMs"}, 7), 7);
}

void ConfigTest::test_layers_merge() {
    QVERIFY(statusboard::data::MergeConfigLayer(
        "user", statusboard::json::Parse(R"({"query": {"retries": 3}})"), std::filesystem::temp_directory_path()));

    QCOMPARE(statusboard::config::ReadIntConfig({"query.retries"}, 0), 3);
    QCOMPARE(statusboard::config::ReadIntConfig({"query.delayMs"}, 0), 50);
}

void ConfigTest::test_value_copy_survives_layer_replacement() {
    const auto channels = statusboard::data::ConfigValue("surfaces.channels");
    QVERIFY(channels.has_value());

    QVERIFY(statusboard::data::MergeConfigLayer(
        "defaults", statusboard::json::Parse(R"({"surfaces": "gone"})"), std::filesystem::temp_directory_path()));

    QVERIFY(channels->is_array());
    QCOMPARE(channels->size(), std::size_t(2));
    QVERIFY(!statusboard::data::ConfigValue("surfaces.channels").has_value());
    QVERIFY(!statusboard::data::ConfigValue("query..timeoutMs").has_value());
}

void ConfigTest::test_required_keys_validation() {
    QVERIFY(statusboard::config::ValidateRequiredKeys(statusboard::config::StatusboardRequiredKeys()).empty());

    QVERIFY(statusboard::data::MergeConfigLayer(
        "broken", statusboard::json::Parse(R"({"query": {"timeoutMs": "soon"}})"), std::filesystem::temp_directory_path()));
    const auto issues = statusboard::config::ValidateRequiredKeys({
        {"query.timeoutMs", statusboard::config::RequiredType::Int},
        {"cycle.missing", statusboard::config::RequiredType::Int},
        {"surfaces.channels", statusboard::config::RequiredType::StringArray}
    });

    QCOMPARE(issues.size(), std::size_t(2));
    QCOMPARE(issues[0].path, std::string("query.timeoutMs"));
    QCOMPARE(issues[1].path, std::string("cycle.missing"));
}

void ConfigTest::test_name_rewrites() {
    const auto rewrites = LoadNameRewrites();
    QCOMPARE(rewrites.size(), std::size_t(1));
    QCOMPARE(rewrites[0].from, std::string("Clan!Twitch"));
    QCOMPARE(rewrites[0].to, std::string("Clan"));
}

void ConfigTest::test_display_strings_from_i18n() {
    statusboard::i18n::Get().setStrings({
        {"snapshot.unknown_server", "Unknown Server"},
        {"snapshot.players_header", "Spieler: {current}/{max}"},
        {"snapshot.player_list_disabled", "Mehr als {cap} Spieler - Liste deaktiviert."}
    });

    const auto strings = LoadDisplayStrings();
    QCOMPARE(strings.playersHeader, std::string("Spieler: {current}/{max}"));
    QCOMPARE(strings.playerListDisabled, std::string("Mehr als {cap} Spieler - Liste deaktiviert."));
    QCOMPARE(strings.unknownServer, std::string("Unknown Server"));
}

void ConfigTest::test_app_settings() {
    const auto settings = LoadAppSettings();
    QVERIFY(settings.has_value());

    QCOMPARE(settings->discordToken, std::string("test-token"));
    QVERIFY(settings->channelIds == (std::vector<std::string>{"111", "222"}));
    QCOMPARE(settings->cycleInterval.count(), std::chrono::milliseconds::rep(15000));
    QCOMPARE(settings->cycle.query.timeout.count(), std::chrono::milliseconds::rep(100));
    QCOMPARE(settings->cycle.query.retries, 1);
    QCOMPARE(settings->cycle.snapshot.maxPopulation, 40);
    QCOMPARE(settings->cycle.snapshot.playerListCap, std::size_t(40));
    QCOMPARE(settings->cycle.clearRecentLimit, std::size_t(100));
    QCOMPARE(settings->discovery.source, std::string("auto"));
    QCOMPARE(settings->discovery.steam.appId, 686810);
    QCOMPARE(settings->discovery.steam.nameFilter.requireAny.size(), std::size_t(3));
    QCOMPARE(settings->logFile.maxFiles, std::size_t(2));
    QCOMPARE(settings->cycle.snapshot.queryWorkers, std::size_t(64));

    QVERIFY(statusboard::data::MergeConfigLayer(
        "user", statusboard::json::Parse(R"({"query": {"workers": 0}})"), std::filesystem::temp_directory_path()));
    QCOMPARE(LoadAppSettings()->cycle.snapshot.queryWorkers, std::size_t(1));
}

void ConfigTest::test_app_settings_require_token() {
    ::unsetenv("DISCORD_TOKEN");
    QVERIFY(!LoadAppSettings().has_value());
}

void ConfigTest::test_app_settings_channel_env_fallback() {
    QVERIFY(statusboard::data::MergeConfigLayer(
        "user", statusboard::json::Parse(R"({"surfaces": {"channels": []}})"), std::filesystem::temp_directory_path()));
    QVERIFY(!LoadAppSettings().has_value());

    ::setenv("CHANNEL_ID_2", "333", 1);
    const auto settings = LoadAppSettings();
    QVERIFY(settings.has_value());
    QVERIFY(settings->channelIds == (std::vector<std::string>{"333"}));
}
