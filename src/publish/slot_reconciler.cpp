#include "publish/slot_reconciler.hpp"

#include "spdlog/spdlog.h"

#include <exception>

namespace {

// A throwing surface call counts as a failed one so the slots already confirmed stay tracked.
template <typename Operation>
auto guarded(const IPublishSurface &surface, const char *action, Operation &&operation) -> decltype(operation()) {
    try {
        return operation();
    } catch (const std::exception &ex) {
        spdlog::error("SlotReconciler: {} in {} threw: {}", action, surface.id(), ex.what());
    }
    return {};
}

} // namespace

ReconcileResult SlotReconciler::reconcile(IPublishSurface &surface,
                                          const std::vector<SlotContent> &contents,
                                          const std::vector<MessageId> &previousSlots) {
    ReconcileResult result;
    result.slots.reserve(contents.size());

    auto sendNew = [&](const SlotContent &content) {
        if (auto messageId = guarded(surface, "send", [&]() { return surface.send(content); })) {
            result.slots.push_back(std::move(*messageId));
            ++result.created;
        } else {
            spdlog::error("SlotReconciler: Failed to send message for '{}' to {}", content.title, surface.id());
            ++result.failures;
        }
    };

    for (std::size_t i = 0; i < contents.size(); ++i) {
        const SlotContent &content = contents[i];
        if (i >= previousSlots.size()) {
            sendNew(content);
            continue;
        }

        const MessageId &existing = previousSlots[i];
        if (guarded(surface, "fetch", [&]() { return surface.fetch(existing); })
            && guarded(surface, "edit", [&]() { return surface.edit(existing, content); })) {
            result.slots.push_back(existing);
            ++result.edited;
            continue;
        }

        spdlog::error("SlotReconciler: Error editing message {} in {}; sending a new one", existing, surface.id());
        ++result.failures;
        sendNew(content);
    }

    for (std::size_t i = contents.size(); i < previousSlots.size(); ++i) {
        const MessageId &stale = previousSlots[i];
        if (guarded(surface, "fetch", [&]() { return surface.fetch(stale); })
            && guarded(surface, "remove", [&]() { return surface.remove(stale); })) {
            ++result.deleted;
        } else {
            spdlog::error("SlotReconciler: Error deleting message {} in {}", stale, surface.id());
            ++result.failures;
        }
    }

    spdlog::debug("SlotReconciler: {} edited, {} created, {} deleted, {} failures in {}",
                  result.edited, result.created, result.deleted, result.failures, surface.id());
    return result;
}
