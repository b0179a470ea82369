#pragma once

#include "change_predicates.hpp"

#include <entt/signal/sigh.hpp>
#include <raylib.h>

#include <cstddef>
#include <unordered_map>

namespace client::replication {

// Local copy of one replicated table, keyed by row identity. Mutated only through the three
// row callbacks; consumers read snapshots and listen on the change signals.
template <typename Row>
class ReplicaStore {
public:
    using Traits = shared::proto::RowTraits<Row>;
    using Key = typename Traits::Key;
    using Map = std::unordered_map<Key, Row, shared::proto::RowKeyHash<Key>>;

    explicit ReplicaStore(ChangeContext ctx = {}) : ctx_(ctx) {}

    ReplicaStore(const ReplicaStore&) = delete;
    ReplicaStore& operator=(const ReplicaStore&) = delete;

    void set_change_context(const ChangeContext& ctx) { ctx_ = ctx; }

    void on_insert(const Row& row) {
        const Key key = Traits::key(row);
        rows_.insert_or_assign(key, row);
        changed_.publish(key);
    }

    // Overwrites only when the update is significant. The comparison baseline is the stored
    // row rather than `previous`, so filtered sub-epsilon steps cannot accumulate unseen.
    // Returns true when the replica changed.
    bool on_update(const Row& /*previous*/, const Row& row) {
        const Key key = Traits::key(row);

        auto it = rows_.find(key);
        if (it == rows_.end()) {
            TraceLog(LOG_DEBUG, "[replica] %s: update for unknown row, applying as insert",
                     shared::proto::entity_type_name(Traits::kType));
            rows_.emplace(key, row);
            changed_.publish(key);
            return true;
        }

        if (!is_significant_change(it->second, row, ctx_)) {
            ++suppressedUpdates_;
            return false;
        }

        it->second = row;
        changed_.publish(key);
        return true;
    }

    // Returns true when a row was removed.
    bool on_delete(const Row& row) {
        const Key key = Traits::key(row);
        if (rows_.erase(key) == 0) {
            TraceLog(LOG_DEBUG, "[replica] %s: delete for unknown row dropped",
                     shared::proto::entity_type_name(Traits::kType));
            return false;
        }
        removed_.publish(key);
        return true;
    }

    void clear() {
        if (rows_.empty()) return;
        rows_.clear();
        cleared_.publish();
    }

    const Row* find(const Key& key) const {
        auto it = rows_.find(key);
        return it == rows_.end() ? nullptr : &it->second;
    }

    bool contains(const Key& key) const { return rows_.find(key) != rows_.end(); }

    Map snapshot() const { return rows_; }
    const Map& view() const { return rows_; }

    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    std::size_t suppressed_updates() const { return suppressedUpdates_; }

    // Signals: on_changed(key) after insert or applied update, on_removed(key) after delete,
    // on_cleared() after teardown.
    auto on_changed() { return entt::sink{changed_}; }
    auto on_removed() { return entt::sink{removed_}; }
    auto on_cleared() { return entt::sink{cleared_}; }

private:
    ChangeContext ctx_;
    Map rows_;
    std::size_t suppressedUpdates_{0};

    entt::sigh<void(const Key&)> changed_;
    entt::sigh<void(const Key&)> removed_;
    entt::sigh<void()> cleared_;
};

} // namespace client::replication
