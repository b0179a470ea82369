/**
 * @file test_chunk_grid.cpp
 * @brief Unit tests for the world chunk grid.
 */

#include <catch2/catch_test_macros.hpp>

#include "world/chunk_grid.hpp"

#include <limits>

using namespace shared::world;

TEST_CASE("Default grid is 5x5 chunks", "[world][grid]") {
    ChunkGrid grid;
    REQUIRE(grid.valid());
    REQUIRE(grid.width_chunks() == 5);
    REQUIRE(grid.height_chunks() == 5);
    REQUIRE(grid.chunk_count() == 25);
}

TEST_CASE("Partial edge chunks are counted", "[world][grid]") {
    ChunkGrid grid;
    grid.chunkSize = 500.0f;
    grid.worldWidth = 1200.0f;
    grid.worldHeight = 1000.0f;

    REQUIRE(grid.width_chunks() == 3);
    REQUIRE(grid.height_chunks() == 2);
}

TEST_CASE("Chunk ids are row-major", "[world][grid]") {
    ChunkGrid grid;
    grid.chunkSize = 100.0f;
    grid.worldWidth = 400.0f;
    grid.worldHeight = 300.0f;

    REQUIRE(grid.to_id(ChunkCoord{0, 0}) == 0);
    REQUIRE(grid.to_id(ChunkCoord{3, 0}) == 3);
    REQUIRE(grid.to_id(ChunkCoord{0, 1}) == 4);
    REQUIRE(grid.to_id(ChunkCoord{2, 2}) == 10);

    REQUIRE(grid.to_coord(10) == ChunkCoord{2, 2});
}

TEST_CASE("Point mapping is deterministic and clamped", "[world][grid]") {
    ChunkGrid grid;
    grid.chunkSize = 100.0f;
    grid.worldWidth = 400.0f;
    grid.worldHeight = 400.0f;

    REQUIRE(grid.chunk_for_point(150.0f, 250.0f) == grid.chunk_for_point(150.0f, 250.0f));
    REQUIRE(grid.coord_for_point(150.0f, 250.0f) == ChunkCoord{1, 2});

    // Cell borders belong to the higher cell.
    REQUIRE(grid.coord_for_point(100.0f, 0.0f) == ChunkCoord{1, 0});

    REQUIRE(grid.coord_for_point(-50.0f, -1.0f) == ChunkCoord{0, 0});
    REQUIRE(grid.coord_for_point(400.0f, 9999.0f) == ChunkCoord{3, 3});
}

TEST_CASE("Invalid grid has no chunks", "[world][grid]") {
    ChunkGrid grid;
    grid.chunkSize = 0.0f;
    REQUIRE_FALSE(grid.valid());
    REQUIRE(grid.chunk_count() == 0);
}

TEST_CASE("Grids whose ids would overflow are invalid", "[world][grid]") {
    ChunkGrid grid;
    grid.chunkSize = 1.0f;
    grid.worldWidth = 100000.0f;
    grid.worldHeight = 100000.0f;

    // 10^10 cells cannot be numbered in a 32-bit ChunkId.
    REQUIRE_FALSE(grid.valid());
    REQUIRE(grid.chunk_count() == 0);

    grid.worldHeight = 40000.0f;
    REQUIRE(grid.valid());
    REQUIRE(grid.chunk_count() == 4000000000u);
    REQUIRE(grid.chunk_for_point(0.5f, 39999.5f) != grid.chunk_for_point(99999.5f, 0.5f));
}

TEST_CASE("Non-finite extents are invalid", "[world][grid]") {
    ChunkGrid grid;
    grid.worldWidth = std::numeric_limits<float>::infinity();
    REQUIRE_FALSE(grid.valid());
    REQUIRE(grid.width_chunks() == 0);

    grid = ChunkGrid{};
    grid.chunkSize = std::numeric_limits<float>::quiet_NaN();
    REQUIRE_FALSE(grid.valid());
    REQUIRE(grid.chunk_count() == 0);
}

TEST_CASE("Non-finite points clamp to the grid", "[world][grid]") {
    ChunkGrid grid;
    REQUIRE(grid.coord_for_point(std::numeric_limits<float>::infinity(), 0.0f) == ChunkCoord{4, 0});
    REQUIRE(grid.coord_for_point(std::numeric_limits<float>::quiet_NaN(), 0.0f) == ChunkCoord{0, 0});
}
