/**
 * @file coordinate_transform.h
 * @brief Mapping between chunk coordinates and diagonal tile coordinates
 *
 */

#pragma once

#include <string>
#include <glm/glm.hpp>

/**
 * @brief Converts between chunk space and the renderer's diagonal tile space
 *
 * The renderer draws chunks as isometric tiles with north up, which is a 45
 * degree rotation of the chunk grid:
 *
 *   col = chunkX + chunkY
 *   row = chunkY - chunkX
 *
 * col + row and col - row are always even, so the mapping is a bijection
 * between all chunk pairs and the "checkerboard" half of tile space.
 *
 * Stateless; safe to call from any thread.
 */
class CoordinateTransform {
public:
    /**
     * @brief Chunk coordinate to tile coordinate
     * @return (col, row)
     */
    static glm::ivec2 convert(int chunkX, int chunkY) {
        return glm::ivec2(chunkX + chunkY, chunkY - chunkX);
    }

    /**
     * @brief Inverse of convert()
     *
     * Only defined for pairs with even col + row (anything convert() produced).
     *
     * @return (chunkX, chunkY)
     */
    static glm::ivec2 unconvert(int col, int row);

    /**
     * @brief Base-36 text of an integer ("-" prefixed when negative)
     *
     * Legacy per-chunk files are named c.<base36 x>.<base36 z>.dat.
     */
    static std::string base36Encode(int value);

    /**
     * @brief Parses base-36 text produced by base36Encode()
     *
     * @param text Digits 0-9 / a-z (either case) with an optional leading '-'
     * @param value Receives the parsed value on success
     * @return False on empty input, invalid digits or overflow
     */
    static bool base36Decode(const std::string& text, int& value);
};
