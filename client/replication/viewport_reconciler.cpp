#include "viewport_reconciler.hpp"

#include <raylib.h>

#include <algorithm>
#include <iterator>
#include <string>

namespace client::replication {

namespace {

interest::ChunkSet difference(const interest::ChunkSet& a, const interest::ChunkSet& b) {
    interest::ChunkSet out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::inserter(out, out.end()));
    return out;
}

std::string join(const interest::ChunkSet& chunks) {
    std::string s;
    for (ChunkId c : chunks) {
        if (!s.empty()) s += ',';
        s += std::to_string(c);
    }
    return s;
}

} // namespace

ViewportReconciler::ViewportReconciler(SubscriptionRegistry& registry,
                                       shared::world::ChunkGrid grid,
                                       std::vector<EntityType> spatialTypes)
    : registry_(registry), grid_(grid), spatialTypes_(std::move(spatialTypes)) {}

ReconcileResult ViewportReconciler::reconcile(const std::optional<interest::Viewport>& viewport) {
    interest::ChunkSet required;
    if (viewport) {
        required = interest::chunks_for_viewport(grid_, *viewport);
    }

    required_ = required;
    return apply_(required);
}

ReconcileResult ViewportReconciler::retry() {
    return apply_(required_);
}

ReconcileResult ViewportReconciler::apply_(const interest::ChunkSet& required) {
    ReconcileResult result;

    for (EntityType type : spatialTypes_) {
        const interest::ChunkSet current = registry_.tracked_chunks(type);

        const interest::ChunkSet removed = difference(current, required);
        const interest::ChunkSet added = difference(required, current);
        if (removed.empty() && added.empty()) {
            continue;
        }

        // Removals go out before additions.
        for (ChunkId c : removed) {
            if (registry_.remove(type, c)) ++result.mutations;
        }
        for (ChunkId c : added) {
            if (registry_.add(type, c)) ++result.mutations;
        }

        result.removed.insert(removed.begin(), removed.end());
        result.added.insert(added.begin(), added.end());
    }

    if (!result.unchanged()) {
        TraceLog(LOG_INFO, "[reconcile] required=%zu +[%s] -[%s] mutations=%zu",
                 required.size(), join(result.added).c_str(), join(result.removed).c_str(), result.mutations);
    }

    return result;
}

} // namespace client::replication
