#pragma once

#include "discovery/provider.hpp"
#include "publish/slot_reconciler.hpp"
#include "query/query_result_cache.hpp"
#include "query/resilient_query_client.hpp"
#include "snapshot/snapshot_builder.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

struct UpdateCycleOptions {
    QueryPolicy query;
    SnapshotOptions snapshot;
    // Zero keeps the server set found at start-up.
    std::chrono::seconds rediscoveryInterval{0};
    std::size_t clearRecentLimit = 100;
};

// Everything that survives from one cycle to the next.
struct CycleState {
    QueryResultCache cache;
    std::vector<ServerRef> servers;
    std::unordered_map<std::string, std::vector<MessageId>> slots;
    std::chrono::steady_clock::time_point lastDiscovery{};
    bool discovered = false;
};

struct CycleReport {
    std::size_t items = 0;
    std::size_t duplicates = 0;
    std::size_t surfacesReconciled = 0;
    std::size_t surfaceFailures = 0;
};

class UpdateCycle {
public:
    UpdateCycle(IQueryTransport &transport,
                IDiscoveryProvider *discovery,
                std::vector<IPublishSurface *> surfaces,
                UpdateCycleOptions options);

    // Replaces the server set with a fresh discovery result. A failed discovery keeps the current set.
    bool refreshServers();
    void setServers(std::vector<ServerRef> servers);

    // Deletes up to clearRecentLimit recent messages from every surface and forgets their slots.
    void clearSurfaces();

    // Runs one complete cycle unless another one is in flight. Returns false when skipped.
    bool runCycleIfIdle();
    bool isRunning() const { return running.load(); }

    std::vector<MessageId> slotsFor(const std::string &surfaceId) const;
    const std::vector<ServerRef> &servers() const { return state.servers; }
    QueryResultCache &cache() { return state.cache; }
    const CycleReport &lastReport() const { return report; }

private:
    void runCycle();
    void clearSurface(IPublishSurface &surface);
    bool rediscoveryDue() const;

    CycleState state;
    IDiscoveryProvider *discovery;
    std::vector<IPublishSurface *> surfaces;
    UpdateCycleOptions options;
    ResilientQueryClient client;
    SnapshotBuilder builder;
    CycleReport report;
    std::atomic<bool> running{false};
};
