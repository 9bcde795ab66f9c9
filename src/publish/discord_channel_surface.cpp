#include "publish/discord_channel_surface.hpp"

#include "common/json.hpp"
#include "spdlog/spdlog.h"

namespace {

// Discord rejects embeds whose title or description exceed these sizes.
constexpr std::size_t MAX_TITLE_LENGTH = 256;
constexpr std::size_t MAX_DESCRIPTION_LENGTH = 4096;

std::string truncateUtf8(const std::string &value, std::size_t maxBytes) {
    if (value.size() <= maxBytes) {
        return value;
    }
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

std::optional<MessageId> parseMessageId(const statusboard::json::Value &message) {
    if (!message.is_object()) {
        return std::nullopt;
    }
    const auto it = message.find("id");
    if (it == message.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

DiscordChannelSurface::DiscordChannelSurface(std::string apiBase, std::string botToken, std::string channelId)
    : apiBase(statusboard::net::TrimTrailingSlash(std::move(apiBase))),
      botToken(std::move(botToken)),
      channelId(std::move(channelId)) {}

std::string DiscordChannelSurface::buildMessagePayload(const SlotContent &content) {
    statusboard::json::Value embed = statusboard::json::Object();
    embed["title"] = truncateUtf8(content.title, MAX_TITLE_LENGTH);
    embed["description"] = truncateUtf8(content.body, MAX_DESCRIPTION_LENGTH);

    statusboard::json::Value payload = statusboard::json::Object();
    payload["embeds"] = statusboard::json::Array();
    payload["embeds"].push_back(std::move(embed));
    return statusboard::json::Dump(payload);
}

std::string DiscordChannelSurface::messagesUrl() const {
    return apiBase + "/channels/" + channelId + "/messages";
}

statusboard::net::HttpRequest DiscordChannelSurface::makeRequest(const std::string &method, const std::string &path) const {
    statusboard::net::HttpRequest request;
    request.method = method;
    request.url = messagesUrl() + path;
    request.headers.push_back("Authorization: Bot " + botToken);
    request.headers.push_back("Content-Type: application/json");
    request.headers.push_back("User-Agent: statusboard (https://discord.com, 1.0)");
    return request;
}

std::optional<std::vector<MessageId>> DiscordChannelSurface::fetchRecent(std::size_t limit) {
    const auto response = statusboard::net::Perform(makeRequest("GET", "?limit=" + std::to_string(limit)));
    if (!response.ok()) {
        spdlog::warn("DiscordChannelSurface: Failed to fetch messages in {}: {}", channelId, response.describeFailure());
        return std::nullopt;
    }

    std::vector<MessageId> ids;
    try {
        const auto jsonData = statusboard::json::Parse(response.body);
        if (!jsonData.is_array()) {
            spdlog::warn("DiscordChannelSurface: Message list for {} is not an array", channelId);
            return std::nullopt;
        }
        for (const auto &message : jsonData) {
            if (auto messageId = parseMessageId(message)) {
                ids.push_back(std::move(*messageId));
            }
        }
    } catch (const std::exception &ex) {
        spdlog::warn("DiscordChannelSurface: Failed to parse message list for {}: {}", channelId, ex.what());
        return std::nullopt;
    }
    return ids;
}

std::optional<MessageId> DiscordChannelSurface::send(const SlotContent &content) {
    auto request = makeRequest("POST", "");
    request.body = buildMessagePayload(content);
    const auto response = statusboard::net::Perform(request);
    if (!response.ok()) {
        spdlog::warn("DiscordChannelSurface: Failed to send message to {}: {}", channelId, response.describeFailure());
        return std::nullopt;
    }

    try {
        if (auto messageId = parseMessageId(statusboard::json::Parse(response.body))) {
            return messageId;
        }
        spdlog::warn("DiscordChannelSurface: Send response from {} carries no message id", channelId);
    } catch (const std::exception &ex) {
        spdlog::warn("DiscordChannelSurface: Failed to parse send response from {}: {}", channelId, ex.what());
    }
    return std::nullopt;
}

bool DiscordChannelSurface::fetch(const MessageId &messageId) {
    const auto response = statusboard::net::Perform(makeRequest("GET", "/" + messageId));
    if (!response.ok()) {
        spdlog::warn("DiscordChannelSurface: Failed to fetch message {} in {}: {}",
                     messageId, channelId, response.describeFailure());
        return false;
    }
    return true;
}

bool DiscordChannelSurface::edit(const MessageId &messageId, const SlotContent &content) {
    auto request = makeRequest("PATCH", "/" + messageId);
    request.body = buildMessagePayload(content);
    const auto response = statusboard::net::Perform(request);
    if (!response.ok()) {
        spdlog::warn("DiscordChannelSurface: Failed to edit message {} in {}: {}",
                     messageId, channelId, response.describeFailure());
        return false;
    }
    return true;
}

bool DiscordChannelSurface::remove(const MessageId &messageId) {
    const auto response = statusboard::net::Perform(makeRequest("DELETE", "/" + messageId));
    if (!response.ok()) {
        spdlog::warn("DiscordChannelSurface: Failed to delete message {} in {}: {}",
                     messageId, channelId, response.describeFailure());
        return false;
    }
    return true;
}
