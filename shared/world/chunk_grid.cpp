#include "chunk_grid.hpp"

#include <algorithm>
#include <cmath>

namespace shared::world {

namespace {

std::uint64_t cells_for_extent_wide(float extent, float chunkSize) {
    if (!std::isfinite(extent) || !std::isfinite(chunkSize)) return 0;
    if (chunkSize <= 0.0f || extent <= 0.0f) return 0;
    const double cells = std::ceil(static_cast<double>(extent) / static_cast<double>(chunkSize));
    if (cells > static_cast<double>(ChunkGrid::kMaxChunkCount)) return ChunkGrid::kMaxChunkCount + 1;
    return static_cast<std::uint64_t>(cells);
}

std::uint32_t cells_for_extent(float extent, float chunkSize) {
    const std::uint64_t cells = cells_for_extent_wide(extent, chunkSize);
    return cells > ChunkGrid::kMaxChunkCount ? 0 : static_cast<std::uint32_t>(cells);
}

std::uint32_t clamp_cell(float v, float chunkSize, std::uint32_t cells) {
    if (cells == 0) return 0;
    if (!(v > 0.0f)) return 0;
    const double cell = std::floor(static_cast<double>(v) / static_cast<double>(chunkSize));
    if (!(cell < static_cast<double>(cells - 1))) return cells - 1;
    return static_cast<std::uint32_t>(cell);
}

} // namespace

bool ChunkGrid::valid() const {
    const std::uint64_t w = cells_for_extent_wide(worldWidth, chunkSize);
    const std::uint64_t h = cells_for_extent_wide(worldHeight, chunkSize);
    if (w == 0 || h == 0) return false;
    if (w > kMaxChunkCount || h > kMaxChunkCount) return false;
    return w * h <= kMaxChunkCount;
}

std::uint32_t ChunkGrid::chunk_count() const {
    if (!valid()) return 0;
    return width_chunks() * height_chunks();
}

std::uint32_t ChunkGrid::width_chunks() const {
    return cells_for_extent(worldWidth, chunkSize);
}

std::uint32_t ChunkGrid::height_chunks() const {
    return cells_for_extent(worldHeight, chunkSize);
}

ChunkCoord ChunkGrid::to_coord(ChunkId id) const {
    const std::uint32_t w = width_chunks();
    if (w == 0) return {};
    return ChunkCoord{id % w, id / w};
}

ChunkCoord ChunkGrid::coord_for_point(float x, float y) const {
    return ChunkCoord{clamp_cell(x, chunkSize, width_chunks()),
                      clamp_cell(y, chunkSize, height_chunks())};
}

} // namespace shared::world
