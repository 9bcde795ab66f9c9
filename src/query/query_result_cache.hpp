#pragma once

#include "query/types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Last successful (info, players) pair per server key. Entries are only ever overwritten as a pair,
// never cleared; the key space is bounded by the discovery source.
class QueryResultCache {
public:
    struct Entry {
        ServerInfo info;
        PlayerList players;
    };

    std::optional<Entry> get(const std::string &key) const;
    void put(const std::string &key, ServerInfo info, PlayerList players);
    std::size_t size() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;
};
