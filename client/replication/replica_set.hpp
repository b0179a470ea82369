#pragma once

#include "replica_store.hpp"
#include "../../shared/protocol/messages.hpp"

#include <entt/signal/sigh.hpp>

#include <cstddef>
#include <cstdint>
#include <tuple>

namespace client::replication {

// One ReplicaStore per replicated table, plus local-actor tracking.
class ReplicaSet {
public:
    ReplicaSet() = default;
    ReplicaSet(ChangeContext ctx, shared::proto::Identity localIdentity);

    ReplicaSet(const ReplicaSet&) = delete;
    ReplicaSet& operator=(const ReplicaSet&) = delete;

    template <typename Row>
    ReplicaStore<Row>& store() { return std::get<ReplicaStore<Row>>(stores_); }

    template <typename Row>
    const ReplicaStore<Row>& store() const { return std::get<ReplicaStore<Row>>(stores_); }

    // Applies a row event to its store. Returns false for messages that are not row events.
    bool apply(const shared::proto::ServiceMessage& msg);

    void clear_all();

    std::size_t size(shared::proto::EntityType type) const;
    std::size_t total_size() const;

    const shared::proto::Identity& local_identity() const { return localIdentity_; }
    bool local_actor_registered() const { return localActorRegistered_; }

    // Fired once when the local actor's row is deleted by the authority.
    auto on_local_actor_removed() { return entt::sink{localActorRemoved_}; }

    // Fired when a Campfire or WoodenStorageBox placed by the local identity first appears.
    // Arguments are the row's table and id.
    auto on_local_placement_confirmed() { return entt::sink{localPlacementConfirmed_}; }

private:
    template <typename Row>
    void apply_row_(const shared::proto::RowEvent<Row>& ev);

    void note_player_inserted_(const shared::proto::Player& player);
    void note_player_deleted_(const shared::proto::Player& player);

    template <typename Row>
    void note_placement_(const Row& row);

    std::tuple<ReplicaStore<shared::proto::Player>,
               ReplicaStore<shared::proto::Tree>,
               ReplicaStore<shared::proto::Stone>,
               ReplicaStore<shared::proto::Mushroom>,
               ReplicaStore<shared::proto::Campfire>,
               ReplicaStore<shared::proto::WoodenStorageBox>,
               ReplicaStore<shared::proto::DroppedItem>,
               ReplicaStore<shared::proto::ItemDefinition>,
               ReplicaStore<shared::proto::InventoryItem>,
               ReplicaStore<shared::proto::Recipe>,
               ReplicaStore<shared::proto::ActiveEquipment>,
               ReplicaStore<shared::proto::CraftingQueueItem>,
               ReplicaStore<shared::proto::WorldState>> stores_;

    shared::proto::Identity localIdentity_{};
    bool localActorRegistered_{false};

    entt::sigh<void()> localActorRemoved_;
    entt::sigh<void(shared::proto::EntityType, std::uint32_t)> localPlacementConfirmed_;
};

} // namespace client::replication
