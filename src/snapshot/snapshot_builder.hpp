#pragma once

#include "query/query_result_cache.hpp"
#include "query/resilient_query_client.hpp"
#include "snapshot/render.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

struct SnapshotOptions {
    // Server i starts its query pair (i + 1) * queryStagger after the build started.
    std::chrono::milliseconds queryStagger{50};
    // Upper bound on query threads per build; the building thread always queries as well.
    std::size_t queryWorkers = 64;
    int minPopulation = 0;
    int maxPopulation = 40;
    std::size_t playerListCap = 40;
    int defaultMaxPlayers = 100;
    std::vector<NameRewrite> nameRewrites;
    DisplayStrings strings;
};

struct Snapshot {
    std::vector<RenderedItem> items;
    std::vector<std::string> duplicateNames;
    std::size_t serversQueried = 0;
    std::size_t serversCached = 0;
};

class SnapshotBuilder {
public:
    SnapshotBuilder(ResilientQueryClient &client, QueryResultCache &cache, SnapshotOptions options);

    Snapshot build(const std::vector<ServerRef> &servers);

    const SnapshotOptions &options() const { return snapshotOptions; }

private:
    struct ServerResult {
        std::string name;
        int currentPlayers = 0;
        int maxPlayers = 0;
        PlayerList players;
        bool cacheWritten = false;
    };

    ServerResult queryServer(const ServerRef &server);
    ServerResult queryServerSafely(const ServerRef &server);
    ServerResult cachedResult(const ServerRef &server) const;
    ServerResult toResult(const ServerInfo &info, PlayerList players) const;

    ResilientQueryClient &client;
    QueryResultCache &cache;
    SnapshotOptions snapshotOptions;
};
