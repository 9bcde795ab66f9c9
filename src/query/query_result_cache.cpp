#include "query/query_result_cache.hpp"

std::optional<QueryResultCache::Entry> QueryResultCache::get(const std::string &key) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = entries.find(key);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void QueryResultCache::put(const std::string &key, ServerInfo info, PlayerList players) {
    Entry entry{std::move(info), std::move(players)};
    std::lock_guard<std::mutex> lock(mutex);
    entries[key] = std::move(entry);
}

std::size_t QueryResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}
