#pragma once

/**
 * @file test_utils.hpp
 * @brief Common test utilities and helpers.
 */

#include "protocol/messages.hpp"
#include "world/chunk_grid.hpp"

#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace test_helpers {

// =============================================================================
// Message type checking helpers
// =============================================================================

/** @brief Check if a ServiceMessage variant holds a specific type. */
template <typename T>
bool is_message_type(const shared::proto::ServiceMessage& msg) {
    return std::holds_alternative<T>(msg);
}

/** @brief Get a message of specific type, or nullptr if wrong type. */
template <typename T>
const T* get_message(const shared::proto::ServiceMessage& msg) {
    return std::get_if<T>(&msg);
}

/** @brief Drain every pending message from a service. */
template <typename Service>
std::vector<shared::proto::ServiceMessage> drain(Service& service) {
    std::vector<shared::proto::ServiceMessage> out;
    shared::proto::ServiceMessage msg;
    while (service.try_recv(msg)) {
        out.push_back(std::move(msg));
    }
    return out;
}

/** @brief Count drained messages of one type. */
template <typename T>
std::size_t count_of(const std::vector<shared::proto::ServiceMessage>& msgs) {
    std::size_t n = 0;
    for (const auto& m : msgs) {
        if (std::holds_alternative<T>(m)) ++n;
    }
    return n;
}

// =============================================================================
// Row construction helpers (C++17 compatible, avoid designated initializers)
// =============================================================================

inline shared::proto::Identity make_identity(std::uint64_t lo) {
    shared::proto::Identity id;
    id.hi = 0xABCDu;
    id.lo = lo;
    return id;
}

inline shared::proto::Player make_player(shared::proto::Identity identity, float x = 100.0f, float y = 100.0f) {
    shared::proto::Player p;
    p.identity = identity;
    p.username = "player-" + std::to_string(identity.lo);
    p.positionX = x;
    p.positionY = y;
    return p;
}

/** @brief Tree placed at (x, y) with its chunk index stamped from `grid`. */
inline shared::proto::Tree make_tree(shared::proto::EntityId id, float x, float y,
                                     const shared::world::ChunkGrid& grid) {
    shared::proto::Tree t;
    t.id = id;
    t.posX = x;
    t.posY = y;
    t.chunkIndex = grid.chunk_for_point(x, y);
    return t;
}

inline shared::proto::Stone make_stone(shared::proto::EntityId id, float x, float y,
                                       const shared::world::ChunkGrid& grid) {
    shared::proto::Stone s;
    s.id = id;
    s.posX = x;
    s.posY = y;
    s.chunkIndex = grid.chunk_for_point(x, y);
    return s;
}

// =============================================================================
// Time helpers
// =============================================================================

using Clock = std::chrono::steady_clock;

/** @brief Fixed origin for tests that drive time by hand. */
inline Clock::time_point t0() {
    return Clock::time_point{} + std::chrono::hours(1);
}

inline Clock::time_point at_ms(long long ms) {
    return t0() + std::chrono::milliseconds(ms);
}

} // namespace test_helpers
