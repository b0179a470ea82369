#pragma once

#include "../net/subscription_service.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace client::replication {

using shared::proto::ChunkId;
using shared::proto::EntityType;

// Owns every live subscription handle of one connection: at most one per (table, chunk) for
// spatial queries and one per table for global queries. All operations are idempotent.
// Subscribe failures are logged and leave the slot empty so a later pass retries it.
class SubscriptionRegistry {
public:
    struct Stats {
        std::size_t adds{0};
        std::size_t removes{0};
        std::size_t failures{0};
    };

    explicit SubscriptionRegistry(net::ISubscriptionService& service);
    ~SubscriptionRegistry();

    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    // Returns true when a new subscription was issued.
    bool add(EntityType type, ChunkId chunk);
    // Returns true when a live subscription was released.
    bool remove(EntityType type, ChunkId chunk);

    bool add_global(EntityType type);
    bool remove_global(EntityType type);

    // Releases everything, spatial and global.
    void remove_all();

    // Outcome notifications from the service. Unknown ids are ignored.
    void on_applied(shared::proto::SubscriptionId id);
    bool on_failed(shared::proto::SubscriptionId id, const std::string& reason);

    bool contains(EntityType type, ChunkId chunk) const;
    bool contains_global(EntityType type) const;
    bool is_applied(EntityType type, ChunkId chunk) const;

    // Chunks with at least one live spatial subscription.
    std::set<ChunkId> tracked_chunks() const;
    // Chunks with a live subscription for `type`.
    std::set<ChunkId> tracked_chunks(EntityType type) const;

    std::size_t live_count() const { return spatial_.size() + global_.size(); }
    std::size_t spatial_count() const { return spatial_.size(); }
    std::size_t global_count() const { return global_.size(); }

    const Stats& stats() const { return stats_; }

    // True once after any subscribe failure since the last call.
    bool take_retry_request();

private:
    struct Entry {
        net::SubscriptionHandle handle;
        bool applied{false};
    };

    using SpatialKey = std::pair<EntityType, ChunkId>;

    bool subscribe_(const shared::proto::Query& query, Entry& out);
    void forget_(shared::proto::SubscriptionId id);

    net::ISubscriptionService& service_;

    std::map<SpatialKey, Entry> spatial_;
    std::map<EntityType, Entry> global_;
    std::unordered_map<shared::proto::SubscriptionId, shared::proto::Query> byId_;

    Stats stats_{};
    bool retryRequested_{false};
};

} // namespace client::replication
