#pragma once

#include "snapshot/render.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

using MessageId = std::string;

// An ordered message channel that can hold one slot per rendered item. Every operation reports
// failure through its return value; implementations log the reason.
class IPublishSurface {
public:
    virtual ~IPublishSurface() = default;

    virtual const std::string &id() const = 0;

    virtual std::optional<std::vector<MessageId>> fetchRecent(std::size_t limit) = 0;
    virtual std::optional<MessageId> send(const SlotContent &content) = 0;
    virtual bool fetch(const MessageId &messageId) = 0;
    virtual bool edit(const MessageId &messageId, const SlotContent &content) = 0;
    virtual bool remove(const MessageId &messageId) = 0;
};
