#include "entities.hpp"

#include <cstdio>
#include <type_traits>

namespace shared::proto {

namespace {

constexpr std::array<const char*, kEntityTypeCount> kEntityTypeNames = {
    "player",
    "tree",
    "stone",
    "mushroom",
    "campfire",
    "wooden_storage_box",
    "dropped_item",
    "item_definition",
    "inventory_item",
    "recipe",
    "active_equipment",
    "crafting_queue_item",
    "world_state",
};

} // namespace

std::string Identity::to_hex() const {
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(hi),
                  static_cast<unsigned long long>(lo));
    return std::string(buf);
}

const char* entity_type_name(EntityType type) {
    const auto idx = static_cast<std::size_t>(type);
    if (idx >= kEntityTypeCount) return "unknown";
    return kEntityTypeNames[idx];
}

std::optional<EntityType> entity_type_from_name(std::string_view name) {
    for (std::size_t i = 0; i < kEntityTypeCount; ++i) {
        if (name == kEntityTypeNames[i]) {
            return static_cast<EntityType>(i);
        }
    }
    return std::nullopt;
}

bool entity_type_is_chunked(EntityType type) {
    switch (type) {
        case EntityType::Tree:
        case EntityType::Stone:
        case EntityType::Mushroom:
        case EntityType::Campfire:
        case EntityType::WoodenStorageBox:
        case EntityType::DroppedItem:
            return true;
        default:
            return false;
    }
}

EntityType row_entity_type(const AnyRow& row) {
    return std::visit([](const auto& r) {
        using Row = std::decay_t<decltype(r)>;
        return RowTraits<Row>::kType;
    }, row);
}

std::optional<ChunkId> row_chunk(const AnyRow& row) {
    return std::visit([](const auto& r) {
        using Row = std::decay_t<decltype(r)>;
        return RowTraits<Row>::chunk(r);
    }, row);
}

} // namespace shared::proto
