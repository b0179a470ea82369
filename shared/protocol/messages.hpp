#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include "entities.hpp"

namespace shared::proto {

using SubscriptionId = std::uint32_t;
static constexpr SubscriptionId kInvalidSubscriptionId = 0;

using ConnectionId = std::uint64_t;

// One subscription predicate: every row of a table, or the rows of one chunk.
struct Query {
    EntityType type{EntityType::Player};
    std::optional<ChunkId> chunk;

    // Authority's textual form, e.g. "SELECT * FROM tree WHERE chunk_index = 7".
    std::string to_sql() const;

    bool matches(const AnyRow& row) const;

    friend bool operator==(const Query& a, const Query& b) { return a.type == b.type && a.chunk == b.chunk; }
    friend bool operator!=(const Query& a, const Query& b) { return !(a == b); }
};

// === Connection notifications ===

struct Connected {
    ConnectionId connectionId{0};
    Identity identity;
};

struct Disconnected {
    std::string reason;
};

struct ConnectError {
    std::string reason;
};

// === Subscription outcome ===

struct SubscriptionApplied {
    SubscriptionId id{kInvalidSubscriptionId};
};

struct SubscriptionFailed {
    SubscriptionId id{kInvalidSubscriptionId};
    std::string reason;
};

// === Row events ===

enum class RowOp : std::uint8_t {
    Insert = 0,
    Update = 1,
    Delete = 2,
};

// Insert: `row` is the new row. Update: `previous` -> `row`. Delete: `row` is the removed row.
template <typename Row>
struct RowEvent {
    RowOp op{RowOp::Insert};
    Row row{};
    Row previous{};
};

template <typename Row>
RowEvent<Row> make_insert(Row row) {
    RowEvent<Row> ev;
    ev.op = RowOp::Insert;
    ev.row = std::move(row);
    return ev;
}

template <typename Row>
RowEvent<Row> make_update(Row previous, Row row) {
    RowEvent<Row> ev;
    ev.op = RowOp::Update;
    ev.row = std::move(row);
    ev.previous = std::move(previous);
    return ev;
}

template <typename Row>
RowEvent<Row> make_delete(Row row) {
    RowEvent<Row> ev;
    ev.op = RowOp::Delete;
    ev.row = std::move(row);
    return ev;
}

template <typename T>
struct is_row_event : std::false_type {};

template <typename Row>
struct is_row_event<RowEvent<Row>> : std::true_type {};

template <typename T>
inline constexpr bool is_row_event_v = is_row_event<T>::value;

using ServiceMessage = std::variant<
    Connected,
    Disconnected,
    ConnectError,
    SubscriptionApplied,
    SubscriptionFailed,
    RowEvent<Player>,
    RowEvent<Tree>,
    RowEvent<Stone>,
    RowEvent<Mushroom>,
    RowEvent<Campfire>,
    RowEvent<WoodenStorageBox>,
    RowEvent<DroppedItem>,
    RowEvent<ItemDefinition>,
    RowEvent<InventoryItem>,
    RowEvent<Recipe>,
    RowEvent<ActiveEquipment>,
    RowEvent<CraftingQueueItem>,
    RowEvent<WorldState>
>;

// Wraps an AnyRow into the matching RowEvent alternative.
ServiceMessage make_row_message(RowOp op, const AnyRow& row, const AnyRow* previous = nullptr);

} // namespace shared::proto
