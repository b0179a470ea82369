/**
 * @file test_replica_store.cpp
 * @brief Unit tests for ReplicaStore event application and change filtering.
 */

#include <catch2/catch_test_macros.hpp>

#include "replication/replica_store.hpp"
#include "test_utils.hpp"

#include <vector>

using namespace client::replication;
using namespace shared::proto;
using namespace test_helpers;

namespace {

// Connected to the store's signals through entt sinks.
template <typename Key>
struct Listener {
    std::vector<Key> changed;
    std::vector<Key> removed;
    int cleared{0};

    void on_changed(const Key& k) { changed.push_back(k); }
    void on_removed(const Key& k) { removed.push_back(k); }
    void on_cleared() { ++cleared; }

    template <typename Store>
    void attach(Store& store) {
        store.on_changed().template connect<&Listener::on_changed>(*this);
        store.on_removed().template connect<&Listener::on_removed>(*this);
        store.on_cleared().template connect<&Listener::on_cleared>(*this);
    }
};

} // namespace

// =============================================================================
// Insert / delete
// =============================================================================

TEST_CASE("Insert stores the row and signals", "[replica]") {
    ReplicaStore<Tree> store;
    Listener<EntityId> listener;
    listener.attach(store);

    Tree t;
    t.id = 4;
    store.on_insert(t);

    REQUIRE(store.size() == 1);
    REQUIRE(store.contains(4));
    REQUIRE(store.find(4)->id == 4);
    REQUIRE(listener.changed == std::vector<EntityId>{4});
}

TEST_CASE("Delete removes the row and signals", "[replica]") {
    ReplicaStore<Tree> store;
    Listener<EntityId> listener;
    listener.attach(store);

    Tree t;
    t.id = 4;
    store.on_insert(t);

    REQUIRE(store.on_delete(t));
    REQUIRE(store.empty());
    REQUIRE(store.find(4) == nullptr);
    REQUIRE(listener.removed == std::vector<EntityId>{4});
}

TEST_CASE("Delete of an unknown row is dropped", "[replica]") {
    ReplicaStore<Tree> store;
    Listener<EntityId> listener;
    listener.attach(store);

    Tree t;
    t.id = 77;
    REQUIRE_FALSE(store.on_delete(t));
    REQUIRE(listener.removed.empty());
}

// =============================================================================
// Updates
// =============================================================================

TEST_CASE("Sub-epsilon position update is suppressed", "[replica]") {
    ChangeContext ctx;
    ctx.positionEpsilon = 0.01f;
    ReplicaStore<Player> store(ctx);
    Listener<Identity> listener;
    listener.attach(store);

    const Player before = make_player(make_identity(1), 100.0f, 200.0f);
    store.on_insert(before);
    listener.changed.clear();

    Player jitter = before;
    jitter.positionX += 0.005f;

    REQUIRE_FALSE(store.on_update(before, jitter));
    REQUIRE(store.find(before.identity)->positionX == 100.0f);
    REQUIRE(listener.changed.empty());
    REQUIRE(store.suppressed_updates() == 1);
}

TEST_CASE("Significant update overwrites and signals", "[replica]") {
    ReplicaStore<Player> store;
    Listener<Identity> listener;
    listener.attach(store);

    const Player before = make_player(make_identity(1), 100.0f, 200.0f);
    store.on_insert(before);
    listener.changed.clear();

    Player moved = before;
    moved.positionX = 110.0f;

    REQUIRE(store.on_update(before, moved));
    REQUIRE(store.find(before.identity)->positionX == 110.0f);
    REQUIRE(listener.changed.size() == 1);
}

TEST_CASE("Filtered steps cannot accumulate unseen", "[replica]") {
    ChangeContext ctx;
    ctx.positionEpsilon = 0.01f;
    ReplicaStore<Player> store(ctx);

    Player p = make_player(make_identity(1), 0.0f, 0.0f);
    store.on_insert(p);

    // Each step is below epsilon; the stored row is the baseline.
    for (int i = 0; i < 5; ++i) {
        Player prev = p;
        p.positionX += 0.004f;
        store.on_update(prev, p);
    }

    REQUIRE(store.find(p.identity)->positionX > 0.0f);
}

TEST_CASE("Vitals compare at display granularity", "[replica]") {
    ReplicaStore<Player> store;
    const Player before = make_player(make_identity(1));
    store.on_insert(before);

    Player tiny = before;
    tiny.health = 99.8f;
    REQUIRE_FALSE(store.on_update(before, tiny));

    Player hurt = before;
    hurt.health = 90.0f;
    REQUIRE(store.on_update(before, hurt));

    Player sprinting = hurt;
    sprinting.isSprinting = true;
    REQUIRE(store.on_update(hurt, sprinting));
}

TEST_CASE("Identical resource update is suppressed", "[replica]") {
    ReplicaStore<Stone> store;
    Stone s;
    s.id = 1;
    s.health = 100;
    store.on_insert(s);

    REQUIRE_FALSE(store.on_update(s, s));

    Stone hit = s;
    hit.health = 80;
    REQUIRE(store.on_update(s, hit));
    REQUIRE(store.find(1)->health == 80);
}

TEST_CASE("Tables without a predicate accept every update", "[replica]") {
    ReplicaStore<Recipe> store;
    Recipe r;
    r.recipeId = 3;
    store.on_insert(r);

    REQUIRE(store.on_update(r, r));
}

TEST_CASE("Update of an unknown row is applied as an insert", "[replica]") {
    ReplicaStore<Tree> store;
    Listener<EntityId> listener;
    listener.attach(store);

    Tree t;
    t.id = 9;
    REQUIRE(store.on_update(t, t));
    REQUIRE(store.contains(9));
    REQUIRE(listener.changed == std::vector<EntityId>{9});
}

// =============================================================================
// Snapshots and teardown
// =============================================================================

TEST_CASE("Snapshot is a detached copy", "[replica]") {
    ReplicaStore<Tree> store;
    Tree t;
    t.id = 1;
    store.on_insert(t);

    auto snap = store.snapshot();
    t.id = 2;
    store.on_insert(t);

    REQUIRE(snap.size() == 1);
    REQUIRE(store.size() == 2);
}

TEST_CASE("Clear empties the store with a single signal", "[replica]") {
    ReplicaStore<Tree> store;
    Listener<EntityId> listener;
    listener.attach(store);

    for (EntityId id = 1; id <= 3; ++id) {
        Tree t;
        t.id = id;
        store.on_insert(t);
    }

    store.clear();
    REQUIRE(store.empty());
    REQUIRE(listener.cleared == 1);
    REQUIRE(listener.removed.empty());

    store.clear();
    REQUIRE(listener.cleared == 1);
}
