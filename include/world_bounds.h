/**
 * @file world_bounds.h
 * @brief Tile-space extent of the explored world
 */

#pragma once

#include <vector>

#include "region_index.h"

/**
 * @brief Inclusive extent in diagonal tile coordinates
 */
struct BoundingBox {
    int minCol = 0;
    int maxCol = 0;
    int minRow = 0;
    int maxRow = 0;

    bool operator==(const BoundingBox& other) const {
        return minCol == other.minCol && maxCol == other.maxCol &&
               minRow == other.minRow && maxRow == other.maxRow;
    }
    bool operator!=(const BoundingBox& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Computes the tile-space bounding box of a set of regions
 *
 * The region rectangle is widened to whole chunks (region * 32 up to
 * region * 32 + 32) and its four corners are pushed through
 * CoordinateTransform::convert(). Because the transform is a 45 degree
 * rotation, the min/max col and row come from different corners; projecting
 * only the min and max corner gives a box that is too small.
 */
class WorldBoundsScanner {
public:
    /**
     * @param regionKeys Discovered region coordinates
     * @param bounds Receives the box on success
     * @return False if regionKeys is empty or the box does not fit in int
     *         tile coordinates (bounds untouched)
     */
    static bool computeBounds(const std::vector<RegionKey>& regionKeys, BoundingBox& bounds);
};
