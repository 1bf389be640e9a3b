/**
 * @file world_utils.h
 * @brief Integer helpers for block, chunk and region coordinates
 *
 */

#pragma once

#include "world_constants.h"

/**
 * @brief Division rounding toward negative infinity
 *
 * C++ integer division truncates toward zero, which puts block -1 in chunk 0.
 * Every block -> chunk -> region step must use this instead of '/'.
 *
 * @param value Dividend (any sign)
 * @param divisor Divisor, must be positive
 */
inline int floorDiv(int value, int divisor) {
    int quotient = value / divisor;
    if ((value % divisor != 0) && (value < 0)) {
        quotient--;
    }
    return quotient;
}

/**
 * @brief Remainder matching floorDiv, always in [0, divisor)
 */
inline int floorMod(int value, int divisor) {
    return value - floorDiv(value, divisor) * divisor;
}

/**
 * @brief Region coordinate containing a chunk coordinate (one axis)
 */
inline int chunkToRegion(int chunkCoord) {
    return floorDiv(chunkCoord, RegionLayout::REGION_CHUNKS);
}

/**
 * @brief Chunk and local coordinates of a block column
 *
 * Chunks are 16x16 columns; X maps to chunkX and Z maps to chunkY (the
 * second horizontal chunk axis).
 */
struct BlockColumnCoordinates {
    int chunkX;   ///< Chunk X coordinate
    int chunkY;   ///< Chunk coordinate along world Z
    int localX;   ///< Block X within the chunk (0-15)
    int localZ;   ///< Block Z within the chunk (0-15)
};

/**
 * @brief Splits a block position into chunk and in-chunk coordinates
 *
 * @code
 * auto c = blockToColumnCoords(-1, 17);
 * // c.chunkX == -1, c.localX == 15, c.chunkY == 1, c.localZ == 1
 * @endcode
 */
inline BlockColumnCoordinates blockToColumnCoords(int blockX, int blockZ) {
    int chunkX = floorDiv(blockX, ChunkLayout::CHUNK_WIDTH);
    int chunkY = floorDiv(blockZ, ChunkLayout::CHUNK_DEPTH);
    return { chunkX, chunkY,
             blockX - chunkX * ChunkLayout::CHUNK_WIDTH,
             blockZ - chunkY * ChunkLayout::CHUNK_DEPTH };
}
