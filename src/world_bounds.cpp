#include "world_bounds.h"
#include "logger.h"
#include "world_constants.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>

namespace {

bool fitsInt(int64_t value) {
    return value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
}

}  // namespace

bool WorldBoundsScanner::computeBounds(const std::vector<RegionKey>& regionKeys, BoundingBox& bounds) {
    if (regionKeys.empty()) {
        Logger::error() << "No regions found, cannot compute world bounds";
        return false;
    }

    Logger::debug() << "Scanning " << regionKeys.size() << " regions for bounds";

    int minRegionX = regionKeys.front().x;
    int maxRegionX = minRegionX;
    int minRegionY = regionKeys.front().y;
    int maxRegionY = minRegionY;
    for (const auto& key : regionKeys) {
        minRegionX = std::min(minRegionX, key.x);
        maxRegionX = std::max(maxRegionX, key.x);
        minRegionY = std::min(minRegionY, key.y);
        maxRegionY = std::max(maxRegionY, key.y);
    }

    // Region -> chunk extent; max is one past the last chunk of the region.
    // Widened so that any int region key is representable.
    constexpr int64_t R = RegionLayout::REGION_CHUNKS;
    const int64_t minX = minRegionX * R;
    const int64_t minY = minRegionY * R;
    const int64_t maxX = maxRegionX * R + R;
    const int64_t maxY = maxRegionY * R + R;

    // Same mapping as CoordinateTransform::convert: (x + y, y - x)
    struct Corner {
        int64_t col;
        int64_t row;
    };
    const std::array<Corner, 4> corners = {{
        {minX + minY, minY - minX},
        {minX + maxY, maxY - minX},
        {maxX + minY, minY - maxX},
        {maxX + maxY, maxY - maxX},
    }};

    int64_t minCol = corners[0].col, maxCol = corners[0].col;
    int64_t minRow = corners[0].row, maxRow = corners[0].row;
    for (const auto& tile : corners) {
        minCol = std::min(minCol, tile.col);
        maxCol = std::max(maxCol, tile.col);
        minRow = std::min(minRow, tile.row);
        maxRow = std::max(maxRow, tile.row);
    }

    if (!fitsInt(minCol) || !fitsInt(maxCol) || !fitsInt(minRow) || !fitsInt(maxRow)) {
        Logger::error() << "World bounds col " << minCol << ".." << maxCol << ", row " << minRow << ".."
                        << maxRow << " are outside the tile coordinate range";
        return false;
    }

    bounds.minCol = static_cast<int>(minCol);
    bounds.maxCol = static_cast<int>(maxCol);
    bounds.minRow = static_cast<int>(minRow);
    bounds.maxRow = static_cast<int>(maxRow);
    Logger::info() << "World bounds: col " << bounds.minCol << ".." << bounds.maxCol
                   << ", row " << bounds.minRow << ".." << bounds.maxRow;
    return true;
}
