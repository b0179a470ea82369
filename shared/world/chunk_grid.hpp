#pragma once

#include "../protocol/entities.hpp"

#include <cstdint>

namespace shared::world {

using shared::proto::ChunkId;

struct ChunkCoord {
    std::uint32_t x{0};
    std::uint32_t y{0};

    friend bool operator==(const ChunkCoord& a, const ChunkCoord& b) { return a.x == b.x && a.y == b.y; }
};

// Fixed-size partition of a finite world. Shared by the authority (to stamp chunkIndex on rows)
// and the client (to turn a viewport into subscriptions), so both must use identical parameters.
struct ChunkGrid {
    float chunkSize{960.0f};
    float worldWidth{4800.0f};
    float worldHeight{4800.0f};

    // Largest grid whose row-major ids fit in a ChunkId.
    static constexpr std::uint64_t kMaxChunkCount = 0xFFFFFFFFull;

    // Finite positive extents and a cell count no larger than kMaxChunkCount.
    bool valid() const;

    std::uint32_t width_chunks() const;
    std::uint32_t height_chunks() const;
    std::uint32_t chunk_count() const;

    ChunkId to_id(ChunkCoord c) const { return c.y * width_chunks() + c.x; }
    ChunkCoord to_coord(ChunkId id) const;

    // Negative coordinates map to column/row 0; coordinates past the world edge map to the
    // last column/row.
    ChunkCoord coord_for_point(float x, float y) const;
    ChunkId chunk_for_point(float x, float y) const { return to_id(coord_for_point(x, y)); }
};

} // namespace shared::world
