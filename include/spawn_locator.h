/**
 * @file spawn_locator.h
 * @brief Finds the walkable spawn position of a world
 *
 */

#pragma once

#include <cstdint>
#include <vector>

#include "persistent_metadata.h"
#include "region_cache.h"
#include "region_index.h"
#include "world_collaborators.h"

enum class SpawnStatus {
    Found,          ///< spawn filled in
    RegionMissing,  ///< spawn chunk's region was never discovered
    ChunkMissing,   ///< region exists but the chunk slot is empty or unreadable
    DecodeFailed    ///< decoder threw or returned an unusable volume
};

/**
 * @brief Resolves the "true" spawn: the first air block at or above the
 *        declared spawn height
 *
 * level.dat almost always declares SpawnY = 64, which is usually inside
 * terrain. The locator decodes the spawn chunk and walks the column upward
 * until it reaches air or the top of the volume.
 */
class SpawnLocator {
public:
    /**
     * @param level Declared spawn position
     * @param regions Region index used to find the spawn chunk's file
     * @param cache Region readers
     * @param decoder Chunk decoder
     * @param spawn Receives the marker (message "Spawn", kind "spawn",
     *        extra "chunk" = [localX, localZ]) when Found is returned
     */
    static SpawnStatus locate(const LevelMetadata& level,
                              const RegionIndex& regions,
                              RegionCache& cache,
                              const ChunkDecoder& decoder,
                              PointOfInterest& spawn);

    /**
     * @brief Scans a block column upward for the first air block
     *
     * Never reads at or above CHUNK_HEIGHT: a column that is solid to the
     * top yields CHUNK_HEIGHT. A negative start height is treated as 0; a
     * start at or above CHUNK_HEIGHT returns CHUNK_HEIGHT without reading.
     *
     * @param blocks Dense volume of ChunkLayout::CHUNK_VOLUME bytes
     * @param localX Column X within the chunk (0-15)
     * @param localZ Column Z within the chunk (0-15)
     * @param startY Height to start at
     * @return Height of the first air block, or CHUNK_HEIGHT
     */
    static int findFirstAir(const std::vector<uint8_t>& blocks, int localX, int localZ, int startY);

    static const char* statusName(SpawnStatus status);
};
