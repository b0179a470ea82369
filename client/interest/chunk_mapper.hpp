#pragma once

#include "../../shared/world/chunk_grid.hpp"

#include <set>

namespace client::interest {

using shared::proto::ChunkId;
using ChunkSet = std::set<ChunkId>;

// Axis-aligned world-space region of interest. Always replaced as a whole.
struct Viewport {
    float minX{0.0f};
    float minY{0.0f};
    float maxX{0.0f};
    float maxY{0.0f};

    float width() const { return maxX - minX; }
    float height() const { return maxY - minY; }

    // Zero or negative area.
    bool degenerate() const { return !(maxX > minX) || !(maxY > minY); }

    Viewport translated(float dx, float dy) const { return Viewport{minX + dx, minY + dy, maxX + dx, maxY + dy}; }
    Viewport expanded(float margin) const { return Viewport{minX - margin, minY - margin, maxX + margin, maxY + margin}; }

    friend bool operator==(const Viewport& a, const Viewport& b) {
        return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX && a.maxY == b.maxY;
    }
};

// Every chunk whose cell overlaps the viewport, partial overlap included. Max edges are
// exclusive: a viewport ending exactly on a chunk border does not reach into the next chunk.
// The viewport is clipped to the world first; a degenerate viewport, or one entirely outside
// the world, maps to the empty set.
ChunkSet chunks_for_viewport(const shared::world::ChunkGrid& grid, const Viewport& viewport);

} // namespace client::interest
