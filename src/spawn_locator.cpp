#include "spawn_locator.h"
#include "logger.h"
#include "world_constants.h"
#include "world_utils.h"

#include <algorithm>
#include <stdexcept>

namespace {

// (x, z, y) order, y fastest
size_t blockIndex(int localX, int localZ, int y) {
    return (static_cast<size_t>(localX) * ChunkLayout::CHUNK_DEPTH + static_cast<size_t>(localZ))
           * ChunkLayout::CHUNK_HEIGHT + static_cast<size_t>(y);
}

}  // namespace

int SpawnLocator::findFirstAir(const std::vector<uint8_t>& blocks, int localX, int localZ, int startY) {
    int y = std::max(startY, 0);
    while (y < ChunkLayout::CHUNK_HEIGHT &&
           blocks[blockIndex(localX, localZ, y)] != ChunkLayout::BLOCK_AIR) {
        y++;
    }
    return std::min(y, ChunkLayout::CHUNK_HEIGHT);
}

SpawnStatus SpawnLocator::locate(const LevelMetadata& level,
                                 const RegionIndex& regions,
                                 RegionCache& cache,
                                 const ChunkDecoder& decoder,
                                 PointOfInterest& spawn) {
    const BlockColumnCoordinates column = blockToColumnCoords(level.spawnX, level.spawnZ);

    std::optional<std::string> regionPath = regions.getRegionPath(column.chunkX, column.chunkY);
    if (!regionPath) {
        Logger::error() << "Spawn chunk (" << column.chunkX << ", " << column.chunkY
                        << ") is not in any discovered region";
        return SpawnStatus::RegionMissing;
    }

    std::optional<ChunkPayload> payload = cache.loadChunk(*regionPath, column.chunkX, column.chunkY);
    if (!payload) {
        Logger::error() << "Spawn chunk (" << column.chunkX << ", " << column.chunkY
                        << ") has no data in " << *regionPath;
        return SpawnStatus::ChunkMissing;
    }

    std::shared_ptr<ChunkData> chunk;
    try {
        chunk = decoder.decode(*payload);
    } catch (const std::exception& e) {
        Logger::error() << "Failed to decode spawn chunk (" << column.chunkX << ", " << column.chunkY
                        << "): " << e.what();
        return SpawnStatus::DecodeFailed;
    }

    if (!chunk) {
        Logger::error() << "Decoder returned no data for spawn chunk";
        return SpawnStatus::DecodeFailed;
    }

    const std::vector<uint8_t>& blocks = chunk->getBlocks();
    if (blocks.size() != ChunkLayout::CHUNK_VOLUME) {
        Logger::error() << "Spawn chunk block volume has " << blocks.size()
                        << " bytes, expected " << ChunkLayout::CHUNK_VOLUME;
        return SpawnStatus::DecodeFailed;
    }

    if (level.spawnY >= ChunkLayout::CHUNK_HEIGHT) {
        Logger::warning() << "Declared spawn height " << level.spawnY << " is above the world, using "
                          << ChunkLayout::CHUNK_HEIGHT;
    }
    const int spawnY = findFirstAir(blocks, column.localX, column.localZ, level.spawnY);

    spawn = PointOfInterest();
    spawn.x = level.spawnX;
    spawn.y = spawnY;
    spawn.z = level.spawnZ;
    spawn.message = "Spawn";
    spawn.kind = "spawn";

    YAML::Node local(YAML::NodeType::Sequence);
    local.push_back(column.localX);
    local.push_back(column.localZ);
    spawn.extra["chunk"] = local;

    Logger::info() << "True spawn at (" << spawn.x << ", " << spawn.y << ", " << spawn.z
                   << "), declared height " << level.spawnY;
    return SpawnStatus::Found;
}

const char* SpawnLocator::statusName(SpawnStatus status) {
    switch (status) {
        case SpawnStatus::Found:         return "found";
        case SpawnStatus::RegionMissing: return "region missing";
        case SpawnStatus::ChunkMissing:  return "chunk missing";
        case SpawnStatus::DecodeFailed:  return "decode failed";
    }
    return "unknown";
}
