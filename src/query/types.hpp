#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ServerRef {
    std::string address;
    uint16_t port = 0;

    std::string key() const { return address + ":" + std::to_string(port); }

    bool operator==(const ServerRef &other) const {
        return address == other.address && port == other.port;
    }
};

// Fields stay unset when a reply did not carry them; a default-constructed value is the "{}" failure result.
struct ServerInfo {
    std::optional<std::string> name;
    std::optional<int> currentPlayers;
    std::optional<int> maxPlayers;

    bool empty() const { return !name && !currentPlayers && !maxPlayers; }

    bool operator==(const ServerInfo &other) const {
        return name == other.name && currentPlayers == other.currentPlayers && maxPlayers == other.maxPlayers;
    }
};

struct PlayerSession {
    std::string name;
    std::optional<double> durationSeconds;

    bool operator==(const PlayerSession &other) const {
        return name == other.name && durationSeconds == other.durationSeconds;
    }
};

using PlayerList = std::vector<PlayerSession>;
