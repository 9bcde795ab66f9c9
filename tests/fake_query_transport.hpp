#pragma once

#include "query/transport.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Scripted in-memory transport. Unknown servers and unset fields throw QueryError.
class FakeQueryTransport : public IQueryTransport {
public:
    struct Script {
        std::optional<ServerInfo> info;
        std::optional<PlayerList> players;
        int infoFailuresBeforeSuccess = 0;
        int playerFailuresBeforeSuccess = 0;
        // Throws an int instead of QueryError from both queries.
        bool throwNonStandard = false;
    };

    void setServer(const ServerRef &server, Script script);

    int infoCalls(const ServerRef &server) const;
    int playerCalls(const ServerRef &server) const;

    // While held, every query blocks until release() is called.
    void hold();
    void release();
    bool waitUntilQueried(std::chrono::milliseconds timeout);

    ServerInfo info(const std::string &address, uint16_t port, std::chrono::milliseconds timeout) override;
    PlayerList players(const std::string &address, uint16_t port, std::chrono::milliseconds timeout) override;

private:
    Script &enter(const std::string &key, std::unordered_map<std::string, int> &counter,
                  std::unique_lock<std::mutex> &lock);

    mutable std::mutex mutex;
    std::condition_variable condition;
    std::unordered_map<std::string, Script> scripts;
    std::unordered_map<std::string, int> infoCallCount;
    std::unordered_map<std::string, int> playerCallCount;
    bool held = false;
    bool queried = false;
};

ServerInfo MakeInfo(const std::string &name, int currentPlayers, int maxPlayers);
PlayerList MakePlayers(int count, const std::string &prefix = "player");
