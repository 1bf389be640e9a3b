/**
 * @file world_collaborators.h
 * @brief Interfaces to the decoders this library consumes but does not implement
 *
 * Chunk tag-tree parsing and level.dat parsing live outside the indexer. The
 * indexer only needs a handful of fields from each, so it talks to them
 * through these narrow interfaces.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "region_reader.h"

/**
 * @brief A decoded chunk as returned by a ChunkDecoder
 */
class ChunkData {
public:
    virtual ~ChunkData() = default;

    /**
     * @brief Block-id volume of the chunk ("Level.Blocks")
     *
     * Expected to be 16 x 16 x 128 bytes ordered (local x, local z, y), y
     * varying fastest. Callers must check the size before indexing.
     */
    virtual const std::vector<uint8_t>& getBlocks() const = 0;
};

/**
 * @brief Turns a raw region payload into a structured chunk
 *
 * Implementations throw (std::runtime_error or derived) on corrupt data;
 * the indexer does not try to recover from it.
 */
class ChunkDecoder {
public:
    virtual ~ChunkDecoder() = default;

    virtual std::shared_ptr<ChunkData> decode(const ChunkPayload& payload) const = 0;
};

/**
 * @brief Fields of level.dat used by the indexer
 */
struct LevelMetadata {
    bool hasVersion = false;  ///< False when the file predates versioned formats
    int version = 0;
    int spawnX = 0;
    int spawnY = 0;
    int spawnZ = 0;
    std::string levelName;
};

/**
 * @brief Reads world metadata (level.dat) for a world directory
 */
class LevelMetadataReader {
public:
    virtual ~LevelMetadataReader() = default;

    /**
     * @param worldRoot World directory
     * @param metadata Receives the parsed fields
     * @return False if the file is missing or unreadable
     */
    virtual bool read(const std::string& worldRoot, LevelMetadata& metadata) const = 0;
};

/**
 * @brief Optional hook run once during initialization when biome data is
 *        requested; receives the world root
 */
using BiomePreparer = std::function<void(const std::string& worldRoot)>;
