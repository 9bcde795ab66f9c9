#pragma once

#include "query/query_result_cache.hpp"
#include "query/transport.hpp"

#include <chrono>

struct QueryPolicy {
    std::chrono::milliseconds timeout{100};
    std::chrono::milliseconds retryDelay{50};
    int retries = 1;
};

enum class ResultSource {
    Live,
    Cached,
    Empty
};

const char *ToString(ResultSource source);

template <typename T>
struct FetchResult {
    T value{};
    ResultSource source = ResultSource::Empty;
};

// Wraps the transport with a bounded retry loop and falls back to the last cached value once the
// retry budget is spent. Never throws; does not write to the cache (see SnapshotBuilder).
class ResilientQueryClient {
public:
    ResilientQueryClient(IQueryTransport &transport, const QueryResultCache &cache, QueryPolicy policy);

    FetchResult<ServerInfo> fetchInfo(const ServerRef &server);
    FetchResult<PlayerList> fetchPlayers(const ServerRef &server);

    const QueryPolicy &policy() const { return queryPolicy; }

private:
    template <typename T, typename Call, typename CachedField>
    FetchResult<T> fetchWithRetry(const ServerRef &server, const char *what, Call call, CachedField cachedField);

    IQueryTransport &transport;
    const QueryResultCache &cache;
    QueryPolicy queryPolicy;
};
