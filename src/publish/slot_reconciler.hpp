#pragma once

#include "publish/surface.hpp"

#include <vector>

struct ReconcileResult {
    std::vector<MessageId> slots;
    std::size_t edited = 0;
    std::size_t created = 0;
    std::size_t deleted = 0;
    std::size_t failures = 0;
};

// Index-aligned reconciliation: position i of the new content reuses previousSlots[i] by editing it
// in place, falling back to a fresh send when the old slot cannot be fetched or edited. Trailing
// slots beyond the new content are deleted best-effort.
class SlotReconciler {
public:
    static ReconcileResult reconcile(IPublishSurface &surface,
                                     const std::vector<SlotContent> &contents,
                                     const std::vector<MessageId> &previousSlots);
};
