#pragma once

#include "../../shared/protocol/entities.hpp"

namespace client::replication {

struct ChangeContext {
    // Player positions closer than this are treated as unchanged.
    float positionEpsilon{0.01f};
};

// Per-table test deciding whether an update carries anything a consumer would notice.
// Tables without a dedicated overload treat every update as significant.

bool is_significant_change(const shared::proto::Player& a, const shared::proto::Player& b, const ChangeContext& ctx);
bool is_significant_change(const shared::proto::Tree& a, const shared::proto::Tree& b, const ChangeContext& ctx);
bool is_significant_change(const shared::proto::Stone& a, const shared::proto::Stone& b, const ChangeContext& ctx);
bool is_significant_change(const shared::proto::Mushroom& a, const shared::proto::Mushroom& b, const ChangeContext& ctx);
bool is_significant_change(const shared::proto::WorldState& a, const shared::proto::WorldState& b, const ChangeContext& ctx);

template <typename Row>
bool is_significant_change(const Row&, const Row&, const ChangeContext&) {
    return true;
}

} // namespace client::replication
