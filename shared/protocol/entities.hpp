#pragma once

#include "identity.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace shared::proto {

using EntityId = std::uint64_t;

// Row-major index of a world grid cell (see shared::world::ChunkGrid).
using ChunkId = std::uint32_t;

// Replicated tables published by the authority.
// WARNING: append-only enum! Config files and logs refer to these by name.
enum class EntityType : std::uint8_t {
    Player = 0,
    Tree,
    Stone,
    Mushroom,
    Campfire,
    WoodenStorageBox,
    DroppedItem,
    ItemDefinition,
    InventoryItem,
    Recipe,
    ActiveEquipment,
    CraftingQueueItem,
    WorldState,

    Count
};

static constexpr std::size_t kEntityTypeCount = static_cast<std::size_t>(EntityType::Count);

// Authority table name ("tree", "dropped_item", ...).
const char* entity_type_name(EntityType type);
std::optional<EntityType> entity_type_from_name(std::string_view name);

// True when rows of this type carry a chunk index and can be subscribed per chunk.
bool entity_type_is_chunked(EntityType type);

// === Rows ===

struct Player {
    Identity identity;
    std::string username;
    float positionX{0.0f};
    float positionY{0.0f};
    float health{100.0f};
    float stamina{100.0f};
    float hunger{100.0f};
    float thirst{100.0f};
    float warmth{100.0f};
    bool isSprinting{false};
    std::uint8_t direction{0};
    std::uint64_t jumpStartTimeMs{0};
    bool isDead{false};
};

enum class TreeType : std::uint8_t {
    Oak = 0,
    Stump = 1,
};

struct Tree {
    EntityId id{0};
    float posX{0.0f};
    float posY{0.0f};
    std::uint32_t health{100};
    TreeType treeType{TreeType::Oak};
    std::uint64_t lastHitTime{0};
    std::uint64_t respawnAt{0};
    ChunkId chunkIndex{0};
};

struct Stone {
    EntityId id{0};
    float posX{0.0f};
    float posY{0.0f};
    std::uint32_t health{100};
    std::uint64_t lastHitTime{0};
    std::uint64_t respawnAt{0};
    ChunkId chunkIndex{0};
};

struct Mushroom {
    EntityId id{0};
    float posX{0.0f};
    float posY{0.0f};
    std::uint64_t respawnAt{0};
    ChunkId chunkIndex{0};
};

struct Campfire {
    std::uint32_t id{0};
    float posX{0.0f};
    float posY{0.0f};
    Identity placedBy;
    bool isBurning{false};
    ChunkId chunkIndex{0};
};

struct WoodenStorageBox {
    std::uint32_t id{0};
    float posX{0.0f};
    float posY{0.0f};
    Identity placedBy;
    ChunkId chunkIndex{0};
};

struct DroppedItem {
    EntityId id{0};
    EntityId itemDefId{0};
    std::uint32_t quantity{1};
    float posX{0.0f};
    float posY{0.0f};
    ChunkId chunkIndex{0};
};

struct ItemDefinition {
    EntityId id{0};
    std::string name;
    std::string description;
    bool isStackable{false};
    std::uint32_t stackSize{1};
};

struct InventoryItem {
    EntityId instanceId{0};
    Identity playerIdentity;
    EntityId itemDefId{0};
    std::uint32_t quantity{1};
    std::optional<std::uint16_t> inventorySlot;
    std::optional<std::uint8_t> hotbarSlot;
};

struct Recipe {
    EntityId recipeId{0};
    EntityId outputItemDefId{0};
    std::uint32_t outputQuantity{1};
    std::uint32_t craftingTimeSecs{0};
};

struct ActiveEquipment {
    Identity playerIdentity;
    std::optional<EntityId> equippedItemDefId;
    std::optional<EntityId> equippedItemInstanceId;
    std::uint64_t swingStartTimeMs{0};
};

struct CraftingQueueItem {
    EntityId queueItemId{0};
    Identity playerIdentity;
    EntityId recipeId{0};
    EntityId outputItemDefId{0};
    std::uint64_t finishTimeMs{0};
};

struct WorldState {
    std::uint32_t id{0};
    float timeOfDay{0.0f};
    bool isFullMoon{false};
    std::uint32_t cycleCount{0};
};

using AnyRow = std::variant<Player,
                            Tree,
                            Stone,
                            Mushroom,
                            Campfire,
                            WoodenStorageBox,
                            DroppedItem,
                            ItemDefinition,
                            InventoryItem,
                            Recipe,
                            ActiveEquipment,
                            CraftingQueueItem,
                            WorldState>;

// === Row traits ===
// kType: owning table; Key: identity of a row within its table; chunk(): grid cell for
// chunked tables, nullopt otherwise.

template <typename Row>
struct RowTraits;

template <>
struct RowTraits<Player> {
    static constexpr EntityType kType = EntityType::Player;
    using Key = Identity;
    static Key key(const Player& r) { return r.identity; }
    static std::optional<ChunkId> chunk(const Player&) { return std::nullopt; }
};

template <>
struct RowTraits<Tree> {
    static constexpr EntityType kType = EntityType::Tree;
    using Key = EntityId;
    static Key key(const Tree& r) { return r.id; }
    static std::optional<ChunkId> chunk(const Tree& r) { return r.chunkIndex; }
};

template <>
struct RowTraits<Stone> {
    static constexpr EntityType kType = EntityType::Stone;
    using Key = EntityId;
    static Key key(const Stone& r) { return r.id; }
    static std::optional<ChunkId> chunk(const Stone& r) { return r.chunkIndex; }
};

template <>
struct RowTraits<Mushroom> {
    static constexpr EntityType kType = EntityType::Mushroom;
    using Key = EntityId;
    static Key key(const Mushroom& r) { return r.id; }
    static std::optional<ChunkId> chunk(const Mushroom& r) { return r.chunkIndex; }
};

template <>
struct RowTraits<Campfire> {
    static constexpr EntityType kType = EntityType::Campfire;
    using Key = std::uint32_t;
    static Key key(const Campfire& r) { return r.id; }
    static std::optional<ChunkId> chunk(const Campfire& r) { return r.chunkIndex; }
};

template <>
struct RowTraits<WoodenStorageBox> {
    static constexpr EntityType kType = EntityType::WoodenStorageBox;
    using Key = std::uint32_t;
    static Key key(const WoodenStorageBox& r) { return r.id; }
    static std::optional<ChunkId> chunk(const WoodenStorageBox& r) { return r.chunkIndex; }
};

template <>
struct RowTraits<DroppedItem> {
    static constexpr EntityType kType = EntityType::DroppedItem;
    using Key = EntityId;
    static Key key(const DroppedItem& r) { return r.id; }
    static std::optional<ChunkId> chunk(const DroppedItem& r) { return r.chunkIndex; }
};

template <>
struct RowTraits<ItemDefinition> {
    static constexpr EntityType kType = EntityType::ItemDefinition;
    using Key = EntityId;
    static Key key(const ItemDefinition& r) { return r.id; }
    static std::optional<ChunkId> chunk(const ItemDefinition&) { return std::nullopt; }
};

template <>
struct RowTraits<InventoryItem> {
    static constexpr EntityType kType = EntityType::InventoryItem;
    using Key = EntityId;
    static Key key(const InventoryItem& r) { return r.instanceId; }
    static std::optional<ChunkId> chunk(const InventoryItem&) { return std::nullopt; }
};

template <>
struct RowTraits<Recipe> {
    static constexpr EntityType kType = EntityType::Recipe;
    using Key = EntityId;
    static Key key(const Recipe& r) { return r.recipeId; }
    static std::optional<ChunkId> chunk(const Recipe&) { return std::nullopt; }
};

template <>
struct RowTraits<ActiveEquipment> {
    static constexpr EntityType kType = EntityType::ActiveEquipment;
    using Key = Identity;
    static Key key(const ActiveEquipment& r) { return r.playerIdentity; }
    static std::optional<ChunkId> chunk(const ActiveEquipment&) { return std::nullopt; }
};

template <>
struct RowTraits<CraftingQueueItem> {
    static constexpr EntityType kType = EntityType::CraftingQueueItem;
    using Key = EntityId;
    static Key key(const CraftingQueueItem& r) { return r.queueItemId; }
    static std::optional<ChunkId> chunk(const CraftingQueueItem&) { return std::nullopt; }
};

template <>
struct RowTraits<WorldState> {
    static constexpr EntityType kType = EntityType::WorldState;
    using Key = std::uint32_t;
    static Key key(const WorldState& r) { return r.id; }
    static std::optional<ChunkId> chunk(const WorldState&) { return std::nullopt; }
};

// Hash usable for every RowTraits<>::Key.
template <typename Key>
struct RowKeyHash {
    std::size_t operator()(const Key& k) const { return std::hash<Key>{}(k); }
};

template <>
struct RowKeyHash<Identity> : IdentityHash {};

EntityType row_entity_type(const AnyRow& row);
std::optional<ChunkId> row_chunk(const AnyRow& row);

} // namespace shared::proto
