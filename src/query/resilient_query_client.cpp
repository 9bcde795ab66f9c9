#include "query/resilient_query_client.hpp"

#include "spdlog/spdlog.h"

#include <thread>

const char *ToString(ResultSource source) {
    switch (source) {
    case ResultSource::Live:
        return "live";
    case ResultSource::Cached:
        return "cached";
    case ResultSource::Empty:
        return "empty";
    }
    return "unknown";
}

ResilientQueryClient::ResilientQueryClient(IQueryTransport &transport, const QueryResultCache &cache, QueryPolicy policy)
    : transport(transport), cache(cache), queryPolicy(policy) {
    if (queryPolicy.retries < 0) {
        queryPolicy.retries = 0;
    }
}

template <typename T, typename Call, typename CachedField>
FetchResult<T> ResilientQueryClient::fetchWithRetry(const ServerRef &server,
                                                    const char *what,
                                                    Call call,
                                                    CachedField cachedField) {
    const std::string serverKey = server.key();
    const int attempts = queryPolicy.retries + 1;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            spdlog::info("ResilientQueryClient: Retrying {} query for {} ({}/{})",
                         what, serverKey, attempt - 1, queryPolicy.retries);
            std::this_thread::sleep_for(queryPolicy.retryDelay);
        }

        try {
            FetchResult<T> result;
            result.value = call();
            result.source = ResultSource::Live;
            spdlog::debug("ResilientQueryClient: {} for {} received", what, serverKey);
            return result;
        } catch (const std::exception &ex) {
            spdlog::error("ResilientQueryClient: Error querying {} for {}: {}", what, serverKey, ex.what());
        } catch (...) {
            spdlog::error("ResilientQueryClient: Error querying {} for {}: unknown error", what, serverKey);
        }
    }

    FetchResult<T> fallback;
    if (const auto entry = cache.get(serverKey)) {
        spdlog::info("ResilientQueryClient: Using cached {} for {}", what, serverKey);
        fallback.value = cachedField(*entry);
        fallback.source = ResultSource::Cached;
    }
    return fallback;
}

FetchResult<ServerInfo> ResilientQueryClient::fetchInfo(const ServerRef &server) {
    return fetchWithRetry<ServerInfo>(
        server, "server info",
        [&]() { return transport.info(server.address, server.port, queryPolicy.timeout); },
        [](const QueryResultCache::Entry &entry) { return entry.info; });
}

FetchResult<PlayerList> ResilientQueryClient::fetchPlayers(const ServerRef &server) {
    return fetchWithRetry<PlayerList>(
        server, "player list",
        [&]() { return transport.players(server.address, server.port, queryPolicy.timeout); },
        [](const QueryResultCache::Entry &entry) { return entry.players; });
}
