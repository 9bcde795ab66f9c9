#pragma once

#include "query/types.hpp"

#include <optional>
#include <string>
#include <vector>

struct RenderedItem {
    std::string displayName;
    int currentPlayers = 0;
    int maxPlayers = 0;
    std::string formattedPlayerBlock;
};

// What a publishing surface stores for one slot.
struct SlotContent {
    std::string title;
    std::string body;

    bool operator==(const SlotContent &other) const {
        return title == other.title && body == other.body;
    }
};

struct NameRewrite {
    std::string from;
    std::string to;
};

struct DisplayStrings {
    std::string unknownServer = "Unknown Server";
    std::string playersHeader = "Players: {current}/{max}";
    std::string playerListDisabled = "More than {cap} players - list disabled.";
};

// Collapses whitespace runs, trims, and inserts U+200B after every '.' so the surface does not
// turn server names into links.
std::string NormalizeServerName(const std::string &name);

// Formats seconds as H:MM (floored). Missing, negative and non-finite durations render as 0:00.
std::string FormatDuration(std::optional<double> seconds);

std::string ApplyNameRewrites(std::string name, const std::vector<NameRewrite> &rewrites);

// Lists "name (H:MM)" per non-blank player, or the disabled placeholder when the raw list is longer than cap.
std::string FormatPlayerBlock(const PlayerList &players, std::size_t cap, const DisplayStrings &strings);

SlotContent BuildSlotContent(const RenderedItem &item, const DisplayStrings &strings);
