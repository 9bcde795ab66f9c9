#include "snapshot/render.hpp"

#include "common/i18n.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace {

constexpr const char *ZERO_WIDTH_SPACE = "\xE2\x80\x8B";

// Byte length of the whitespace character starting at pos, 0 if there is none. Covers ASCII
// whitespace plus the UTF-8 encoded Unicode spaces that show up in server names.
std::size_t whitespaceLength(const std::string &text, std::size_t pos) {
    const auto byte = [&](std::size_t offset) -> unsigned char {
        return pos + offset < text.size() ? static_cast<unsigned char>(text[pos + offset]) : 0;
    };

    const unsigned char lead = byte(0);
    if (std::isspace(lead)) {
        return 1;
    }
    switch (lead) {
    case 0xC2: // U+0085, U+00A0
        return byte(1) == 0x85 || byte(1) == 0xA0 ? 2 : 0;
    case 0xE1: // U+1680
        return byte(1) == 0x9A && byte(2) == 0x80 ? 3 : 0;
    case 0xE2:
        if (byte(1) == 0x80) { // U+2000..U+200A, U+2028, U+2029, U+202F
            const unsigned char last = byte(2);
            return (last >= 0x80 && last <= 0x8A) || last == 0xA8 || last == 0xA9 || last == 0xAF ? 3 : 0;
        }
        return byte(1) == 0x81 && byte(2) == 0x9F ? 3 : 0; // U+205F
    case 0xE3: // U+3000
        return byte(1) == 0x80 && byte(2) == 0x80 ? 3 : 0;
    case 0xEF: // U+FEFF
        return byte(1) == 0xBB && byte(2) == 0xBF ? 3 : 0;
    default:
        return 0;
    }
}

bool isBlank(const std::string &value) {
    std::size_t pos = 0;
    while (pos < value.size()) {
        const std::size_t length = whitespaceLength(value, pos);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

} // namespace

std::string NormalizeServerName(const std::string &name) {
    std::string collapsed;
    collapsed.reserve(name.size());
    bool pendingSpace = false;
    std::size_t pos = 0;
    while (pos < name.size()) {
        if (const std::size_t length = whitespaceLength(name, pos)) {
            pendingSpace = true;
            pos += length;
            continue;
        }
        if (pendingSpace && !collapsed.empty()) {
            collapsed.push_back(' ');
        }
        pendingSpace = false;
        collapsed.push_back(name[pos++]);
    }

    std::string result;
    result.reserve(collapsed.size() + 8);
    for (char ch : collapsed) {
        result.push_back(ch);
        if (ch == '.') {
            result += ZERO_WIDTH_SPACE;
        }
    }
    return result;
}

std::string FormatDuration(std::optional<double> seconds) {
    const double value = seconds.value_or(0.0);
    if (!std::isfinite(value) || value < 0.0) {
        return "0:00";
    }

    // Stays in floating point: A2S durations are floats and may exceed any integer type.
    const double totalMinutes = std::floor(value / 60.0);
    const double hours = std::floor(totalMinutes / 60.0);
    const double minutes = std::fmod(totalMinutes, 60.0);

    char buffer[400]; // enough for the integral digits of the largest double
    std::snprintf(buffer, sizeof(buffer), "%.0f:%02.0f", hours, minutes);
    return buffer;
}

std::string ApplyNameRewrites(std::string name, const std::vector<NameRewrite> &rewrites) {
    for (const auto &rewrite : rewrites) {
        if (rewrite.from.empty()) {
            continue;
        }
        std::size_t pos = 0;
        while ((pos = name.find(rewrite.from, pos)) != std::string::npos) {
            name.replace(pos, rewrite.from.size(), rewrite.to);
            pos += rewrite.to.size();
        }
    }
    return name;
}

std::string FormatPlayerBlock(const PlayerList &players, std::size_t cap, const DisplayStrings &strings) {
    if (players.size() > cap) {
        return statusboard::i18n::Get().formatText(strings.playerListDisabled, {{"cap", std::to_string(cap)}});
    }

    std::string block;
    for (const auto &player : players) {
        if (player.name.empty() || isBlank(player.name)) {
            continue;
        }
        if (!block.empty()) {
            block.push_back('\n');
        }
        block += player.name + " (" + FormatDuration(player.durationSeconds) + ")";
    }
    return block;
}

SlotContent BuildSlotContent(const RenderedItem &item, const DisplayStrings &strings) {
    SlotContent content;
    content.title = item.displayName;
    content.body = statusboard::i18n::Get().formatText(strings.playersHeader, {
        {"current", std::to_string(item.currentPlayers)},
        {"max", std::to_string(item.maxPlayers)}
    });
    if (!item.formattedPlayerBlock.empty()) {
        content.body += "\n\n" + item.formattedPlayerBlock;
    }
    return content;
}
