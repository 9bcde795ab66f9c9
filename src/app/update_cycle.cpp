#include "app/update_cycle.hpp"

#include "spdlog/spdlog.h"

#include <exception>

namespace {

class RunningGuard {
public:
    explicit RunningGuard(std::atomic<bool> &flag) : flag(flag) {}
    ~RunningGuard() { flag.store(false); }

    RunningGuard(const RunningGuard &) = delete;
    RunningGuard &operator=(const RunningGuard &) = delete;

private:
    std::atomic<bool> &flag;
};

} // namespace

UpdateCycle::UpdateCycle(IQueryTransport &transport,
                         IDiscoveryProvider *discovery,
                         std::vector<IPublishSurface *> surfaces,
                         UpdateCycleOptions options)
    : discovery(discovery),
      surfaces(std::move(surfaces)),
      options(std::move(options)),
      client(transport, state.cache, this->options.query),
      builder(client, state.cache, this->options.snapshot) {}

bool UpdateCycle::refreshServers() {
    if (!discovery) {
        return false;
    }

    state.lastDiscovery = std::chrono::steady_clock::now();
    state.discovered = true;

    auto found = discovery->discover();
    if (!found) {
        spdlog::warn("UpdateCycle: Discovery via {} failed, keeping {} known servers",
                     discovery->describe(), state.servers.size());
        return false;
    }

    if (found->empty()) {
        spdlog::warn("UpdateCycle: Discovery via {} returned no servers", discovery->describe());
    }
    state.servers = std::move(*found);
    return true;
}

void UpdateCycle::setServers(std::vector<ServerRef> servers) {
    state.servers = std::move(servers);
}

void UpdateCycle::clearSurfaces() {
    for (auto *surface : surfaces) {
        try {
            clearSurface(*surface);
        } catch (const std::exception &ex) {
            spdlog::error("UpdateCycle: Clearing {} failed: {}", surface->id(), ex.what());
        }
    }
}

void UpdateCycle::clearSurface(IPublishSurface &surface) {
    const auto recent = surface.fetchRecent(options.clearRecentLimit);
    if (!recent) {
        spdlog::warn("UpdateCycle: Could not list messages in {}, leaving it as is", surface.id());
        return;
    }

    std::size_t removed = 0;
    for (const auto &messageId : *recent) {
        if (surface.remove(messageId)) {
            ++removed;
        }
    }
    state.slots[surface.id()].clear();
    spdlog::info("Cleared {} of {} messages in {}", removed, recent->size(), surface.id());
}

bool UpdateCycle::runCycleIfIdle() {
    bool expected = false;
    if (!running.compare_exchange_strong(expected, true)) {
        spdlog::info("UpdateCycle: Previous update still running, skipping");
        return false;
    }
    RunningGuard guard(running);

    try {
        runCycle();
    } catch (const std::exception &ex) {
        spdlog::error("UpdateCycle: Update failed: {}", ex.what());
    }
    return true;
}

std::vector<MessageId> UpdateCycle::slotsFor(const std::string &surfaceId) const {
    if (auto it = state.slots.find(surfaceId); it != state.slots.end()) {
        return it->second;
    }
    return {};
}

bool UpdateCycle::rediscoveryDue() const {
    if (!discovery) {
        return false;
    }
    if (!state.discovered) {
        return true;
    }
    if (options.rediscoveryInterval.count() <= 0) {
        return false;
    }
    return std::chrono::steady_clock::now() - state.lastDiscovery >= options.rediscoveryInterval;
}

void UpdateCycle::runCycle() {
    if (rediscoveryDue()) {
        refreshServers();
    }

    report = CycleReport{};
    const Snapshot snapshot = builder.build(state.servers);
    report.items = snapshot.items.size();
    report.duplicates = snapshot.duplicateNames.size();

    std::vector<SlotContent> contents;
    contents.reserve(snapshot.items.size());
    for (const auto &item : snapshot.items) {
        contents.push_back(BuildSlotContent(item, builder.options().strings));
    }

    // One broken surface keeps its previous slots and does not hold back the others.
    for (auto *surface : surfaces) {
        auto &slots = state.slots[surface->id()];
        try {
            auto result = SlotReconciler::reconcile(*surface, contents, slots);
            slots = std::move(result.slots);
            ++report.surfacesReconciled;
            report.surfaceFailures += result.failures;
            spdlog::debug("UpdateCycle: {} -> {} edited, {} created, {} deleted, {} failed",
                          surface->id(), result.edited, result.created, result.deleted, result.failures);
        } catch (const std::exception &ex) {
            ++report.surfaceFailures;
            spdlog::error("UpdateCycle: Reconcile failed for {}: {}", surface->id(), ex.what());
        }
    }

    spdlog::info("Update complete: {} servers shown on {} channels", report.items, report.surfacesReconciled);
}
