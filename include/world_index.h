/**
 * @file world_index.h
 * @brief World-level index shared by the tile renderer
 *
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "config.h"
#include "coordinate_transform.h"
#include "logger.h"
#include "persistent_metadata.h"
#include "region_cache.h"
#include "region_index.h"
#include "spawn_locator.h"
#include "world_bounds.h"
#include "world_collaborators.h"
#include "world_constants.h"

/**
 * @brief Result of WorldIndex::initialize()
 *
 * Every value other than None means the world cannot be rendered; the
 * caller decides whether that ends the process.
 */
enum class WorldIndexError {
    None,
    MetadataUnreadable,        ///< level.dat missing or unreadable
    UnsupportedVersion,        ///< level.dat version is not the McRegion format
    RegionListUnreadable,      ///< configured region list file cannot be read
    NoRegionsFound,            ///< zero region files discovered
    RegionOpenFailed,          ///< a discovered region file could not be opened
    SpawnRegionMissing,        ///< spawn chunk lies outside all regions
    SpawnChunkMissing,         ///< spawn chunk slot is empty
    SpawnDecodeFailed,         ///< spawn chunk could not be decoded
    PersistentDataUnreadable   ///< side-car file exists but is malformed
};

/**
 * @brief Settings for one WorldIndex
 *
 * Config file layout:
 * ```ini
 * [World]
 * path = /home/me/.minecraft/saves/World1
 * region_list = regions.txt     ; optional, one region file per line
 * region_extension = mcr
 * metadata_file = overviewer.dat
 * use_biome_data = false
 *
 * [Logging]
 * level = info
 * colors = true
 * ```
 */
struct WorldIndexOptions {
    std::string worldPath;
    std::string regionListFile;                 ///< Empty: walk the region directory
    std::vector<std::string> regionList;        ///< Used when useRegionList is set
    bool useRegionList = false;
    std::string regionExtension = RegionLayout::DEFAULT_EXTENSION;
    std::string metadataFile = LevelFormat::DEFAULT_METADATA_FILE;
    bool useBiomeData = false;

    LogLevel logLevel = LogLevel::INFO;
    bool logColors = true;

    /**
     * @brief Reads options from a loaded Config
     * @return False if [World] path is missing or [Logging] level is invalid
     */
    static bool fromConfig(const Config& config, WorldIndexOptions& options);

    /**
     * @brief Pushes the logging settings to Logger
     */
    void applyLogging() const;
};

/**
 * @brief Index of one world: region files, open readers, bounds, spawn, markers
 *
 * Usage:
 * @code
 * WorldIndex world(options, levelReader, chunkDecoder);
 * WorldIndexError err = world.initialize();
 * if (err != WorldIndexError::None) {
 *     Logger::error() << WorldIndex::getErrorString(err);
 *     return 1;
 * }
 * for (int col = world.getMinCol(); col <= world.getMaxCol(); ++col) { ... }
 * @endcode
 *
 * initialize() runs once, single-threaded. After it succeeds the index is
 * read-mostly: getRegionPath(), loadChunk(), coordinate conversion and the
 * bounds may be used from many threads at once. Marker changes go through
 * the add*() methods, which lock, and reach disk only when save() is called.
 */
class WorldIndex {
public:
    /**
     * @param options World location and discovery settings
     * @param levelReader level.dat decoder (must outlive the index)
     * @param decoder Chunk decoder (must outlive the index)
     * @param biomePreparer Run during initialize() when options.useBiomeData is set
     */
    WorldIndex(WorldIndexOptions options,
               const LevelMetadataReader& levelReader,
               const ChunkDecoder& decoder,
               BiomePreparer biomePreparer = nullptr);

    WorldIndex(const WorldIndex&) = delete;
    WorldIndex& operator=(const WorldIndex&) = delete;

    /**
     * @brief Runs the whole indexing pass
     *
     * Order: level.dat version check, biome preparation, side-car load,
     * region discovery, reader warm-up, bounds, spawn. Stops at the first
     * failure; in particular nothing is discovered when the version is wrong.
     */
    WorldIndexError initialize();

    bool isInitialized() const { return m_initialized; }
    WorldIndexError getLastError() const { return m_lastError; }
    static const char* getErrorString(WorldIndexError error);

    // ========== Chunk Access ==========

    /**
     * @brief Path of the region file holding a chunk
     * @return std::nullopt if the chunk's region was not discovered
     */
    std::optional<std::string> getRegionPath(int chunkX, int chunkY) const;

    /**
     * @brief Reads and decodes a chunk
     *
     * @return The decoded chunk, or nullptr if the slot is empty
     * @throws Whatever the ChunkDecoder throws on corrupt data
     */
    std::shared_ptr<ChunkData> loadChunk(const std::string& path, int chunkX, int chunkY);

    static glm::ivec2 convertCoords(int chunkX, int chunkY) {
        return CoordinateTransform::convert(chunkX, chunkY);
    }
    static glm::ivec2 unconvertCoords(int col, int row) {
        return CoordinateTransform::unconvert(col, row);
    }

    // ========== Bounds ==========

    const BoundingBox& getBounds() const { return m_bounds; }
    int getMinCol() const { return m_bounds.minCol; }
    int getMaxCol() const { return m_bounds.maxCol; }
    int getMinRow() const { return m_bounds.minRow; }
    int getMaxRow() const { return m_bounds.maxRow; }

    // ========== Points of Interest ==========

    /**
     * @brief Adds a marker for this run (the spawn marker lives here too)
     */
    void addPointOfInterest(PointOfInterest poi);

    /**
     * @brief Snapshot of this run's markers in insertion order
     */
    std::vector<PointOfInterest> getPointsOfInterest() const;

    /**
     * @brief Adds a marker to the persisted list (written by save())
     */
    void addPersistentPointOfInterest(PointOfInterest poi);

    /**
     * @brief Stores a named value in the side-car extensions
     */
    void setPersistentExtension(const std::string& key, const YAML::Node& value);

    /**
     * @brief Snapshot of the state save() would write
     */
    PersistentState getPersistentState() const;

    /**
     * @brief Writes the persisted state to the side-car file
     *
     * Refuses (returns false) after initialize() failed to parse an existing
     * side-car file, so the user's markers are never replaced by a partial list.
     */
    bool save() const;

    // ========== Accessors ==========

    const WorldIndexOptions& getOptions() const { return m_options; }
    const LevelMetadata& getLevel() const { return m_level; }
    const RegionIndex& getRegionIndex() const { return m_regions; }
    RegionCache& getRegionCache() { return m_cache; }
    std::string getMetadataPath() const;

private:
    WorldIndexError fail(WorldIndexError error);
    bool warmRegionCache();

    WorldIndexOptions m_options;
    const LevelMetadataReader& m_levelReader;
    const ChunkDecoder& m_decoder;
    BiomePreparer m_biomePreparer;

    LevelMetadata m_level;
    RegionIndex m_regions;
    RegionCache m_cache;
    BoundingBox m_bounds;

    mutable std::mutex m_poiMutex;  ///< Guards m_pointsOfInterest and m_persistentState
    std::vector<PointOfInterest> m_pointsOfInterest;
    PersistentState m_persistentState;
    bool m_persistentUnreadable = false;  ///< Side-car exists but failed to parse

    bool m_initialized = false;
    WorldIndexError m_lastError = WorldIndexError::None;
};
