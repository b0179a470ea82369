#pragma once

#include "subscription_registry.hpp"
#include "../interest/chunk_mapper.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace client::replication {

struct ReconcileResult {
    interest::ChunkSet added;
    interest::ChunkSet removed;
    // Registry calls that actually issued or released a subscription.
    std::size_t mutations{0};

    bool unchanged() const { return added.empty() && removed.empty(); }
};

// Drives spatial subscriptions from the viewport. Each pass diffs the required chunk set
// against what the registry actually holds (per spatial table), so a pass that was cut short,
// or a pair whose subscribe failed, is repaired by the next pass.
class ViewportReconciler {
public:
    ViewportReconciler(SubscriptionRegistry& registry,
                       shared::world::ChunkGrid grid,
                       std::vector<EntityType> spatialTypes);

    // A null viewport requires no chunks.
    ReconcileResult reconcile(const std::optional<interest::Viewport>& viewport);

    // Re-runs the last pass against the current registry state.
    ReconcileResult retry();

    ReconcileResult clear() { return reconcile(std::nullopt); }

    const interest::ChunkSet& required() const { return required_; }
    const std::vector<EntityType>& spatial_types() const { return spatialTypes_; }
    const shared::world::ChunkGrid& grid() const { return grid_; }

private:
    ReconcileResult apply_(const interest::ChunkSet& required);

    SubscriptionRegistry& registry_;
    shared::world::ChunkGrid grid_;
    std::vector<EntityType> spatialTypes_;

    interest::ChunkSet required_;
};

} // namespace client::replication
