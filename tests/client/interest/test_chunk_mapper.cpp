/**
 * @file test_chunk_mapper.cpp
 * @brief Unit tests for viewport to chunk-set mapping.
 */

#include <catch2/catch_test_macros.hpp>

#include "interest/chunk_mapper.hpp"

using namespace client::interest;
using shared::world::ChunkCoord;
using shared::world::ChunkGrid;

namespace {

ChunkGrid grid_of(float chunkSize, float worldSize) {
    ChunkGrid g;
    g.chunkSize = chunkSize;
    g.worldWidth = worldSize;
    g.worldHeight = worldSize;
    return g;
}

ChunkSet ids_of(const ChunkGrid& g, std::initializer_list<ChunkCoord> coords) {
    ChunkSet out;
    for (const auto& c : coords) out.insert(g.to_id(c));
    return out;
}

} // namespace

// =============================================================================
// Basic mapping
// =============================================================================

TEST_CASE("Viewport covering four cells maps to those four chunks", "[interest][mapper]") {
    const ChunkGrid g = grid_of(500.0f, 1000.0f);
    const Viewport vp{0.0f, 0.0f, 1000.0f, 1000.0f};

    const ChunkSet expected = ids_of(g, {{0, 0}, {1, 0}, {0, 1}, {1, 1}});
    REQUIRE(chunks_for_viewport(g, vp) == expected);
}

TEST_CASE("Small shifts keep the chunk set unchanged", "[interest][mapper]") {
    SECTION("world edge clips a positive shift") {
        // The +10 shift only keeps the set because the 1000-unit world clips the max edge
        // back to 1000; max edges are exclusive, so an unclipped 1010 reaches column 2.
        const ChunkGrid g = grid_of(500.0f, 1000.0f);
        const Viewport vp{0.0f, 0.0f, 1000.0f, 1000.0f};

        REQUIRE(chunks_for_viewport(g, vp.translated(10.0f, 10.0f)) == chunks_for_viewport(g, vp));
        REQUIRE(chunks_for_viewport(g, vp.translated(-10.0f, -10.0f)) == chunks_for_viewport(g, vp));
    }

    SECTION("interior shift that stays inside the same cells") {
        const ChunkGrid g = grid_of(500.0f, 4800.0f);
        const Viewport vp{0.0f, 0.0f, 1000.0f, 1000.0f};

        REQUIRE(chunks_for_viewport(g, vp.translated(-10.0f, -10.0f)) == chunks_for_viewport(g, vp));
        REQUIRE(chunks_for_viewport(g, vp).size() == 4);

        // Without the clip a positive shift crosses into the next column and row.
        REQUIRE(chunks_for_viewport(g, vp.translated(10.0f, 10.0f)).size() == 9);
    }
}

TEST_CASE("Partial overlap includes the cell", "[interest][mapper]") {
    const ChunkGrid g = grid_of(100.0f, 1000.0f);
    const Viewport vp{95.0f, 95.0f, 105.0f, 105.0f};

    const ChunkSet expected = ids_of(g, {{0, 0}, {1, 0}, {0, 1}, {1, 1}});
    REQUIRE(chunks_for_viewport(g, vp) == expected);
}

TEST_CASE("Max edges are exclusive", "[interest][mapper]") {
    const ChunkGrid g = grid_of(100.0f, 1000.0f);

    // Ends exactly on the border of cell 1.
    const Viewport vp{0.0f, 0.0f, 100.0f, 100.0f};
    REQUIRE(chunks_for_viewport(g, vp) == ChunkSet{0});
}

TEST_CASE("Viewport is clipped to the world", "[interest][mapper]") {
    const ChunkGrid g = grid_of(100.0f, 300.0f);
    const Viewport vp{-500.0f, -500.0f, 5000.0f, 5000.0f};

    REQUIRE(chunks_for_viewport(g, vp).size() == 9);
}

// =============================================================================
// Degenerate input
// =============================================================================

TEST_CASE("Degenerate viewports map to nothing", "[interest][mapper]") {
    const ChunkGrid g = grid_of(100.0f, 1000.0f);

    REQUIRE(chunks_for_viewport(g, Viewport{10.0f, 10.0f, 10.0f, 50.0f}).empty());
    REQUIRE(chunks_for_viewport(g, Viewport{10.0f, 10.0f, 50.0f, 10.0f}).empty());
    REQUIRE(chunks_for_viewport(g, Viewport{50.0f, 50.0f, 10.0f, 10.0f}).empty());
    REQUIRE(chunks_for_viewport(g, Viewport{}).empty());
}

TEST_CASE("Viewport outside the world maps to nothing", "[interest][mapper]") {
    const ChunkGrid g = grid_of(100.0f, 1000.0f);

    REQUIRE(chunks_for_viewport(g, Viewport{-300.0f, -300.0f, -100.0f, -100.0f}).empty());
    REQUIRE(chunks_for_viewport(g, Viewport{1000.0f, 0.0f, 1200.0f, 200.0f}).empty());
}

TEST_CASE("Invalid grid maps to nothing", "[interest][mapper]") {
    const ChunkGrid g = grid_of(0.0f, 1000.0f);
    REQUIRE(chunks_for_viewport(g, Viewport{0.0f, 0.0f, 500.0f, 500.0f}).empty());
}

// =============================================================================
// Determinism
// =============================================================================

TEST_CASE("Mapping is deterministic", "[interest][mapper]") {
    const ChunkGrid g;
    const Viewport vp{1234.5f, 2100.25f, 2700.0f, 3000.0f};

    const ChunkSet first = chunks_for_viewport(g, vp);
    for (int i = 0; i < 10; ++i) {
        REQUIRE(chunks_for_viewport(g, vp) == first);
    }
}

TEST_CASE("Mapped set agrees with point mapping", "[interest][mapper]") {
    const ChunkGrid g;
    const Viewport vp{1000.0f, 1500.0f, 2500.0f, 2100.0f};
    const ChunkSet chunks = chunks_for_viewport(g, vp);

    REQUIRE(chunks.count(g.chunk_for_point(vp.minX, vp.minY)) == 1);
    REQUIRE(chunks.count(g.chunk_for_point(2499.0f, 2099.0f)) == 1);
    REQUIRE(chunks.count(g.chunk_for_point(1700.0f, 1800.0f)) == 1);
    REQUIRE(chunks.count(g.chunk_for_point(3000.0f, 1800.0f)) == 0);
}
