#include "chunk_mapper.hpp"

#include <algorithm>
#include <cmath>

namespace client::interest {

ChunkSet chunks_for_viewport(const shared::world::ChunkGrid& grid, const Viewport& viewport) {
    ChunkSet out;

    if (!grid.valid() || viewport.degenerate()) {
        return out;
    }

    const float minX = std::max(viewport.minX, 0.0f);
    const float minY = std::max(viewport.minY, 0.0f);
    const float maxX = std::min(viewport.maxX, grid.worldWidth);
    const float maxY = std::min(viewport.maxY, grid.worldHeight);
    if (!(maxX > minX) || !(maxY > minY)) {
        return out;
    }

    const std::uint32_t w = grid.width_chunks();
    const std::uint32_t h = grid.height_chunks();

    const auto first_cell = [&](float v) {
        return static_cast<std::uint32_t>(std::floor(v / grid.chunkSize));
    };
    const auto last_cell = [&](float v, std::uint32_t cells) {
        const auto c = static_cast<std::int64_t>(std::ceil(v / grid.chunkSize)) - 1;
        return static_cast<std::uint32_t>(std::clamp<std::int64_t>(c, 0, static_cast<std::int64_t>(cells) - 1));
    };

    const std::uint32_t x0 = std::min(first_cell(minX), w - 1);
    const std::uint32_t y0 = std::min(first_cell(minY), h - 1);
    const std::uint32_t x1 = last_cell(maxX, w);
    const std::uint32_t y1 = last_cell(maxY, h);

    for (std::uint32_t cy = y0; cy <= y1; ++cy) {
        for (std::uint32_t cx = x0; cx <= x1; ++cx) {
            out.insert(grid.to_id(shared::world::ChunkCoord{cx, cy}));
        }
    }

    return out;
}

} // namespace client::interest
