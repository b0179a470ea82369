#include "change_predicates.hpp"

#include <cmath>

namespace client::replication {

namespace proto = shared::proto;

namespace {

bool rounded_differs(float a, float b) {
    return std::lround(a) != std::lround(b);
}

} // namespace

bool is_significant_change(const proto::Player& a, const proto::Player& b, const ChangeContext& ctx) {
    const bool moved = std::fabs(a.positionX - b.positionX) > ctx.positionEpsilon ||
                       std::fabs(a.positionY - b.positionY) > ctx.positionEpsilon;
    if (moved) return true;

    // Vitals are shown as whole numbers.
    if (rounded_differs(a.health, b.health) ||
        rounded_differs(a.stamina, b.stamina) ||
        rounded_differs(a.hunger, b.hunger) ||
        rounded_differs(a.thirst, b.thirst) ||
        rounded_differs(a.warmth, b.warmth)) {
        return true;
    }

    return a.isSprinting != b.isSprinting ||
           a.direction != b.direction ||
           a.jumpStartTimeMs != b.jumpStartTimeMs ||
           a.isDead != b.isDead ||
           a.username != b.username;
}

bool is_significant_change(const proto::Tree& a, const proto::Tree& b, const ChangeContext&) {
    return a.posX != b.posX ||
           a.posY != b.posY ||
           a.health != b.health ||
           a.treeType != b.treeType ||
           a.lastHitTime != b.lastHitTime ||
           a.respawnAt != b.respawnAt ||
           a.chunkIndex != b.chunkIndex;
}

bool is_significant_change(const proto::Stone& a, const proto::Stone& b, const ChangeContext&) {
    return a.posX != b.posX ||
           a.posY != b.posY ||
           a.health != b.health ||
           a.lastHitTime != b.lastHitTime ||
           a.respawnAt != b.respawnAt ||
           a.chunkIndex != b.chunkIndex;
}

bool is_significant_change(const proto::Mushroom& a, const proto::Mushroom& b, const ChangeContext&) {
    return a.posX != b.posX ||
           a.posY != b.posY ||
           a.respawnAt != b.respawnAt ||
           a.chunkIndex != b.chunkIndex;
}

bool is_significant_change(const proto::WorldState& a, const proto::WorldState& b, const ChangeContext&) {
    return a.timeOfDay != b.timeOfDay ||
           a.isFullMoon != b.isFullMoon ||
           a.cycleCount != b.cycleCount;
}

} // namespace client::replication
