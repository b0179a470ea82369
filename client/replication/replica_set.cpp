#include "replica_set.hpp"

#include <raylib.h>

#include <type_traits>

namespace client::replication {

namespace proto = shared::proto;

ReplicaSet::ReplicaSet(ChangeContext ctx, proto::Identity localIdentity)
    : localIdentity_(localIdentity) {
    std::apply([&](auto&... s) { (s.set_change_context(ctx), ...); }, stores_);
}

template <typename Row>
void ReplicaSet::note_placement_(const Row& row) {
    if (localIdentity_.is_null() || row.placedBy != localIdentity_) return;

    constexpr auto type = proto::RowTraits<Row>::kType;
    TraceLog(LOG_DEBUG, "[replica] placement confirmed: %s #%u",
             proto::entity_type_name(type), static_cast<unsigned>(row.id));
    localPlacementConfirmed_.publish(type, row.id);
}

bool ReplicaSet::apply(const proto::ServiceMessage& msg) {
    return std::visit([this](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (proto::is_row_event_v<T>) {
            apply_row_(m);
            return true;
        } else {
            return false;
        }
    }, msg);
}

template <typename Row>
void ReplicaSet::apply_row_(const proto::RowEvent<Row>& ev) {
    auto& s = store<Row>();

    switch (ev.op) {
        case proto::RowOp::Insert: {
            const bool known = s.contains(proto::RowTraits<Row>::key(ev.row));
            s.on_insert(ev.row);
            if constexpr (std::is_same_v<Row, proto::Player>) {
                note_player_inserted_(ev.row);
            }
            if constexpr (std::is_same_v<Row, proto::Campfire> || std::is_same_v<Row, proto::WoodenStorageBox>) {
                // Redelivered inserts do not confirm twice.
                if (!known) note_placement_(ev.row);
            }
            break;
        }
        case proto::RowOp::Update:
            s.on_update(ev.previous, ev.row);
            if constexpr (std::is_same_v<Row, proto::Player>) {
                // An update can be the first sighting when the insert raced a resubscribe.
                note_player_inserted_(ev.row);
            }
            break;
        case proto::RowOp::Delete:
            s.on_delete(ev.row);
            if constexpr (std::is_same_v<Row, proto::Player>) {
                note_player_deleted_(ev.row);
            }
            break;
    }
}

void ReplicaSet::note_player_inserted_(const proto::Player& player) {
    if (localActorRegistered_ || localIdentity_.is_null()) return;
    if (player.identity != localIdentity_) return;

    localActorRegistered_ = true;
    TraceLog(LOG_INFO, "[replica] local actor registered: %s (%s)",
             player.username.c_str(), player.identity.to_hex().c_str());
}

void ReplicaSet::note_player_deleted_(const proto::Player& player) {
    if (!localActorRegistered_ || player.identity != localIdentity_) return;

    localActorRegistered_ = false;
    TraceLog(LOG_WARNING, "[replica] local actor removed by authority: %s", player.identity.to_hex().c_str());
    localActorRemoved_.publish();
}

void ReplicaSet::clear_all() {
    std::apply([](auto&... s) { (s.clear(), ...); }, stores_);
    localActorRegistered_ = false;
}

std::size_t ReplicaSet::size(proto::EntityType type) const {
    std::size_t n = 0;
    std::apply([&](const auto&... s) {
        ((n += (std::decay_t<decltype(s)>::Traits::kType == type ? s.size() : 0)), ...);
    }, stores_);
    return n;
}

std::size_t ReplicaSet::total_size() const {
    std::size_t n = 0;
    std::apply([&](const auto&... s) { ((n += s.size()), ...); }, stores_);
    return n;
}

} // namespace client::replication
