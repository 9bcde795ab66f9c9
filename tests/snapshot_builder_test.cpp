#include "snapshot_builder_test.hpp"

#include "fake_query_transport.hpp"
#include "snapshot/snapshot_builder.hpp"

#include <algorithm>

namespace {

ServerRef serverAt(uint16_t port) {
    return ServerRef{"10.0.0.1", port};
}

QueryPolicy fastPolicy() {
    QueryPolicy policy;
    policy.timeout = std::chrono::milliseconds(10);
    policy.retryDelay = std::chrono::milliseconds(0);
    policy.retries = 1;
    return policy;
}

SnapshotOptions fastOptions() {
    SnapshotOptions options;
    options.queryStagger = std::chrono::milliseconds(0);
    return options;
}

struct Fixture {
    FakeQueryTransport transport;
    QueryResultCache cache;
    ResilientQueryClient client{transport, cache, fastPolicy()};

    Snapshot build(const std::vector<ServerRef> &servers, SnapshotOptions options = fastOptions()) {
        SnapshotBuilder builder(client, cache, std::move(options));
        return builder.build(servers);
    }
};

} // namespace

void SnapshotBuilderTest::test_population_filter_and_order() {
    Fixture fixture;
    const std::vector<std::pair<std::string, int>> population = {
        {"Empty", 0}, {"Quiet", 5}, {"Overfull", 41}, {"Full A", 40}, {"Full B", 40}
    };
    std::vector<ServerRef> servers;
    for (std::size_t i = 0; i < population.size(); ++i) {
        servers.push_back(serverAt(static_cast<uint16_t>(27015 + i)));
        fixture.transport.setServer(servers.back(),
                                    {MakeInfo(population[i].first, population[i].second, 64), MakePlayers(3)});
    }

    const auto snapshot = fixture.build(servers);

    QCOMPARE(snapshot.items.size(), std::size_t(3));
    QCOMPARE(snapshot.items[0].displayName, std::string("Full A"));
    QCOMPARE(snapshot.items[1].displayName, std::string("Full B"));
    QCOMPARE(snapshot.items[2].displayName, std::string("Quiet"));
    QCOMPARE(snapshot.items[0].currentPlayers, 40);
    QCOMPARE(snapshot.items[2].currentPlayers, 5);
    QCOMPARE(snapshot.serversQueried, std::size_t(5));
}

void SnapshotBuilderTest::test_duplicate_names_keep_first() {
    Fixture fixture;
    const std::vector<ServerRef> servers = {serverAt(27015), serverAt(27016)};
    fixture.transport.setServer(servers[0], {MakeInfo("Same  Name", 10, 64), MakePlayers(1)});
    fixture.transport.setServer(servers[1], {MakeInfo("Same Name", 20, 64), MakePlayers(1)});

    const auto snapshot = fixture.build(servers);

    QCOMPARE(snapshot.items.size(), std::size_t(1));
    QCOMPARE(snapshot.items[0].currentPlayers, 20);
    QCOMPARE(snapshot.duplicateNames.size(), std::size_t(1));
    QCOMPARE(snapshot.duplicateNames[0], std::string("Same Name"));
}

void SnapshotBuilderTest::test_rewrites_apply_before_dedupe() {
    Fixture fixture;
    const std::vector<ServerRef> servers = {serverAt(27015), serverAt(27016)};
    fixture.transport.setServer(servers[0], {MakeInfo("Clan!Twitch Night", 12, 64), MakePlayers(1)});
    fixture.transport.setServer(servers[1], {MakeInfo("Clan Night", 8, 64), MakePlayers(1)});

    auto options = fastOptions();
    options.nameRewrites = {{"Clan!Twitch", "Clan"}};
    const auto snapshot = fixture.build(servers, options);

    QCOMPARE(snapshot.items.size(), std::size_t(1));
    QCOMPARE(snapshot.items[0].displayName, std::string("Clan Night"));
    QCOMPARE(snapshot.items[0].currentPlayers, 12);
}

void SnapshotBuilderTest::test_player_list_cap() {
    Fixture fixture;
    const std::vector<ServerRef> servers = {serverAt(27015), serverAt(27016)};
    fixture.transport.setServer(servers[0], {MakeInfo("Crowded", 30, 64), MakePlayers(41)});
    fixture.transport.setServer(servers[1], {MakeInfo("Busy", 20, 64), MakePlayers(40)});

    const auto snapshot = fixture.build(servers);

    QCOMPARE(snapshot.items.size(), std::size_t(2));
    QCOMPARE(snapshot.items[0].formattedPlayerBlock, std::string("More than 40 players - list disabled."));
    QVERIFY(snapshot.items[1].formattedPlayerBlock.rfind("player0 (0:00)\nplayer1 (0:01)", 0) == 0);
    QCOMPARE(std::count(snapshot.items[1].formattedPlayerBlock.begin(),
                        snapshot.items[1].formattedPlayerBlock.end(), '\n'), std::ptrdiff_t(39));
}

void SnapshotBuilderTest::test_defaults_for_missing_fields() {
    Fixture fixture;
    const std::vector<ServerRef> servers = {serverAt(27015)};
    ServerInfo info;
    info.name = "";
    info.currentPlayers = 7;
    fixture.transport.setServer(servers[0], {info, PlayerList{}});

    const auto snapshot = fixture.build(servers);

    QCOMPARE(snapshot.items.size(), std::size_t(1));
    QCOMPARE(snapshot.items[0].displayName, std::string("Unknown Server"));
    QCOMPARE(snapshot.items[0].maxPlayers, 100);
    QCOMPARE(snapshot.items[0].formattedPlayerBlock, std::string());
}

void SnapshotBuilderTest::test_live_pair_is_cached() {
    Fixture fixture;
    const std::vector<ServerRef> servers = {serverAt(27015)};
    fixture.transport.setServer(servers[0], {MakeInfo("Live", 4, 32), MakePlayers(4)});

    const auto snapshot = fixture.build(servers);

    QCOMPARE(snapshot.serversCached, std::size_t(1));
    const auto entry = fixture.cache.get(servers[0].key());
    QVERIFY(entry.has_value());
    QVERIFY(entry->info == MakeInfo("Live", 4, 32));
    QVERIFY(entry->players == MakePlayers(4));
}

void SnapshotBuilderTest::test_mixed_pair_keeps_previous_entry() {
    Fixture fixture;
    const std::vector<ServerRef> servers = {serverAt(27015)};
    fixture.cache.put(servers[0].key(), MakeInfo("Old", 3, 32), MakePlayers(3, "old"));
    fixture.transport.setServer(servers[0], {MakeInfo("New", 6, 32), std::nullopt});

    const auto snapshot = fixture.build(servers);

    QCOMPARE(snapshot.items.size(), std::size_t(1));
    QCOMPARE(snapshot.items[0].displayName, std::string("New"));
    QCOMPARE(snapshot.items[0].currentPlayers, 6);
    QVERIFY(snapshot.items[0].formattedPlayerBlock.rfind("old0", 0) == 0);
    QCOMPARE(snapshot.serversCached, std::size_t(0));

    const auto entry = fixture.cache.get(servers[0].key());
    QVERIFY(entry->info == MakeInfo("Old", 3, 32));
    QVERIFY(entry->players == MakePlayers(3, "old"));
}

void SnapshotBuilderTest::test_unreachable_server_uses_cache() {
    Fixture fixture;
    const std::vector<ServerRef> servers = {serverAt(27015), serverAt(27016)};
    fixture.cache.put(servers[0].key(), MakeInfo("Remembered", 9, 32), MakePlayers(2));

    const auto snapshot = fixture.build(servers);

    QCOMPARE(snapshot.items.size(), std::size_t(1));
    QCOMPARE(snapshot.items[0].displayName, std::string("Remembered"));
    QCOMPARE(snapshot.items[0].currentPlayers, 9);
}

void SnapshotBuilderTest::test_small_worker_pool_queries_every_server() {
    Fixture fixture;
    std::vector<ServerRef> servers;
    for (int i = 0; i < 9; ++i) {
        servers.push_back(serverAt(static_cast<uint16_t>(27015 + i)));
        fixture.transport.setServer(servers.back(), {MakeInfo("Server " + std::to_string(i), i + 1, 64), MakePlayers(1)});
    }

    auto options = fastOptions();
    options.queryWorkers = 2;
    const auto snapshot = fixture.build(servers, options);

    QCOMPARE(snapshot.items.size(), std::size_t(9));
    QCOMPARE(snapshot.items[0].displayName, std::string("Server 8"));
    QCOMPARE(snapshot.items[8].displayName, std::string("Server 0"));
    QCOMPARE(snapshot.serversCached, std::size_t(9));
    for (const auto &server : servers) {
        QCOMPARE(fixture.transport.infoCalls(server), 1);
        QCOMPARE(fixture.transport.playerCalls(server), 1);
    }
}

void SnapshotBuilderTest::test_without_workers_queries_on_calling_thread() {
    Fixture fixture;
    const std::vector<ServerRef> servers = {serverAt(27015), serverAt(27016), serverAt(27017)};
    fixture.transport.setServer(servers[0], {MakeInfo("One", 3, 32), MakePlayers(3)});
    fixture.transport.setServer(servers[2], {MakeInfo("Three", 5, 32), MakePlayers(5)});

    auto options = fastOptions();
    options.queryWorkers = 0;
    const auto snapshot = fixture.build(servers, options);

    QCOMPARE(snapshot.items.size(), std::size_t(2));
    QCOMPARE(snapshot.items[0].displayName, std::string("Three"));
    QCOMPARE(snapshot.items[1].displayName, std::string("One"));
    QCOMPARE(snapshot.serversQueried, std::size_t(3));
    QCOMPARE(snapshot.serversCached, std::size_t(2));
}

void SnapshotBuilderTest::test_non_standard_exception_uses_cache() {
    Fixture fixture;
    const std::vector<ServerRef> servers = {serverAt(27015), serverAt(27016)};
    FakeQueryTransport::Script broken;
    broken.throwNonStandard = true;
    fixture.transport.setServer(servers[0], broken);
    fixture.transport.setServer(servers[1], {MakeInfo("Healthy", 4, 32), MakePlayers(4)});
    fixture.cache.put(servers[0].key(), MakeInfo("Remembered", 9, 32), MakePlayers(2));

    const auto snapshot = fixture.build(servers);

    QCOMPARE(snapshot.items.size(), std::size_t(2));
    QCOMPARE(snapshot.items[0].displayName, std::string("Remembered"));
    QCOMPARE(snapshot.items[1].displayName, std::string("Healthy"));
    QCOMPARE(snapshot.serversCached, std::size_t(1));
    QVERIFY(fixture.cache.get(servers[0].key())->info == MakeInfo("Remembered", 9, 32));
}
