#pragma once

#include "publish/surface.hpp"

#include "common/http_client.hpp"

#include <string>

// Discord text channel driven through the REST API; each slot is one message carrying one embed.
class DiscordChannelSurface : public IPublishSurface {
public:
    DiscordChannelSurface(std::string apiBase, std::string botToken, std::string channelId);

    const std::string &id() const override { return channelId; }

    std::optional<std::vector<MessageId>> fetchRecent(std::size_t limit) override;
    std::optional<MessageId> send(const SlotContent &content) override;
    bool fetch(const MessageId &messageId) override;
    bool edit(const MessageId &messageId, const SlotContent &content) override;
    bool remove(const MessageId &messageId) override;

    static std::string buildMessagePayload(const SlotContent &content);

private:
    statusboard::net::HttpRequest makeRequest(const std::string &method, const std::string &path) const;
    std::string messagesUrl() const;

    std::string apiBase;
    std::string botToken;
    std::string channelId;
};
