#include "snapshot/snapshot_builder.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>
#include <unordered_set>

namespace {

// Joins every started thread when it goes out of scope.
class WorkerGroup {
public:
    explicit WorkerGroup(std::size_t capacity) { threads.reserve(capacity); }
    ~WorkerGroup() {
        for (auto &thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    WorkerGroup(const WorkerGroup &) = delete;
    WorkerGroup &operator=(const WorkerGroup &) = delete;

    template <typename Function>
    bool start(const Function &function) {
        try {
            threads.emplace_back(function);
            return true;
        } catch (const std::system_error &ex) {
            spdlog::warn("SnapshotBuilder: Could not start query worker {}: {}", threads.size() + 1, ex.what());
            return false;
        }
    }

private:
    std::vector<std::thread> threads;
};

} // namespace

SnapshotBuilder::SnapshotBuilder(ResilientQueryClient &client, QueryResultCache &cache, SnapshotOptions options)
    : client(client), cache(cache), snapshotOptions(std::move(options)) {}

SnapshotBuilder::ServerResult SnapshotBuilder::queryServer(const ServerRef &server) {
    const std::string serverKey = server.key();
    auto info = client.fetchInfo(server);
    auto players = client.fetchPlayers(server);

    bool cacheWritten = false;
    // Only a pair obtained live in this round replaces the cached pair; a mixed live/cached pair is
    // displayed but never stored.
    if (info.source == ResultSource::Live && players.source == ResultSource::Live) {
        cache.put(serverKey, info.value, players.value);
        cacheWritten = true;
    } else {
        spdlog::debug("SnapshotBuilder: Keeping previous cache entry for {} (info {}, players {})",
                      serverKey, ToString(info.source), ToString(players.source));
    }

    ServerResult result = toResult(info.value, std::move(players.value));
    result.cacheWritten = cacheWritten;
    return result;
}

SnapshotBuilder::ServerResult SnapshotBuilder::queryServerSafely(const ServerRef &server) {
    try {
        return queryServer(server);
    } catch (const std::exception &ex) {
        spdlog::error("SnapshotBuilder: Error querying server {}: {}", server.key(), ex.what());
    } catch (...) {
        spdlog::error("SnapshotBuilder: Error querying server {}: unknown error", server.key());
    }
    return cachedResult(server);
}

SnapshotBuilder::ServerResult SnapshotBuilder::cachedResult(const ServerRef &server) const {
    if (const auto entry = cache.get(server.key())) {
        spdlog::info("SnapshotBuilder: Using cached results for {}", server.key());
        return toResult(entry->info, entry->players);
    }
    return toResult(ServerInfo{}, PlayerList{});
}

SnapshotBuilder::ServerResult SnapshotBuilder::toResult(const ServerInfo &info, PlayerList players) const {
    ServerResult result;
    result.currentPlayers = info.currentPlayers.value_or(0);
    result.maxPlayers = info.maxPlayers.value_or(0);
    if (result.maxPlayers == 0) {
        result.maxPlayers = snapshotOptions.defaultMaxPlayers;
    }
    if (info.name && !info.name->empty()) {
        result.name = NormalizeServerName(*info.name);
    } else {
        result.name = snapshotOptions.strings.unknownServer;
    }
    result.players = std::move(players);
    return result;
}

Snapshot SnapshotBuilder::build(const std::vector<ServerRef> &servers) {
    std::vector<ServerResult> results(servers.size());
    const auto started = std::chrono::steady_clock::now();
    std::atomic<std::size_t> next{0};

    const auto drain = [this, &servers, &results, &next, started]() {
        for (std::size_t i = next.fetch_add(1); i < servers.size(); i = next.fetch_add(1)) {
            std::this_thread::sleep_until(started + snapshotOptions.queryStagger * static_cast<long long>(i + 1));
            results[i] = queryServerSafely(servers[i]);
        }
    };

    {
        const std::size_t wanted = std::min(snapshotOptions.queryWorkers, servers.size());
        WorkerGroup workers(wanted);
        for (std::size_t worker = 0; worker < wanted; ++worker) {
            if (!workers.start(drain)) {
                break;
            }
        }
        // Picks up whatever the workers have not claimed, everything if none could start.
        drain();
    }

    Snapshot snapshot;
    snapshot.serversQueried = servers.size();

    std::vector<const ServerResult *> visible;
    visible.reserve(results.size());
    for (const auto &result : results) {
        if (result.cacheWritten) {
            ++snapshot.serversCached;
        }
        if (result.currentPlayers > snapshotOptions.minPopulation &&
            result.currentPlayers <= snapshotOptions.maxPopulation) {
            visible.push_back(&result);
        }
    }

    std::stable_sort(visible.begin(), visible.end(), [](const ServerResult *a, const ServerResult *b) {
        return a->currentPlayers > b->currentPlayers;
    });

    std::unordered_set<std::string> seenNames;
    for (const ServerResult *result : visible) {
        std::string displayName = ApplyNameRewrites(result->name, snapshotOptions.nameRewrites);
        if (!seenNames.insert(displayName).second) {
            spdlog::warn("SnapshotBuilder: Duplicate server name detected: {}", displayName);
            snapshot.duplicateNames.push_back(std::move(displayName));
            continue;
        }

        RenderedItem item;
        item.displayName = std::move(displayName);
        item.currentPlayers = result->currentPlayers;
        item.maxPlayers = result->maxPlayers;
        item.formattedPlayerBlock = FormatPlayerBlock(result->players, snapshotOptions.playerListCap,
                                                      snapshotOptions.strings);
        snapshot.items.push_back(std::move(item));
    }

    spdlog::info("SnapshotBuilder: {} servers queried, {} shown, {} duplicates",
                 snapshot.serversQueried, snapshot.items.size(), snapshot.duplicateNames.size());
    return snapshot;
}
