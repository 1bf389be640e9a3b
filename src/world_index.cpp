#include "world_index.h"

#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

// ========== Options ==========

bool WorldIndexOptions::fromConfig(const Config& config, WorldIndexOptions& options) {
    options.worldPath = config.getString("World", "path");
    if (options.worldPath.empty()) {
        Logger::error() << "Config is missing [World] path";
        return false;
    }

    options.regionListFile = config.getString("World", "region_list");
    options.regionExtension = config.getString("World", "region_extension", RegionLayout::DEFAULT_EXTENSION);
    options.metadataFile = config.getString("World", "metadata_file", LevelFormat::DEFAULT_METADATA_FILE);
    options.useBiomeData = config.getBool("World", "use_biome_data", false);

    if (config.hasKey("Logging", "level")) {
        const std::string levelName = config.getString("Logging", "level");
        if (!Logger::parseLevel(levelName, options.logLevel)) {
            Logger::error() << "Unknown log level in config: " << levelName;
            return false;
        }
    }
    options.logColors = config.getBool("Logging", "colors", true);

    return true;
}

void WorldIndexOptions::applyLogging() const {
    Logger::setMinLevel(logLevel);
    Logger::setUseColors(logColors);
}

// ========== WorldIndex ==========

WorldIndex::WorldIndex(WorldIndexOptions options,
                       const LevelMetadataReader& levelReader,
                       const ChunkDecoder& decoder,
                       BiomePreparer biomePreparer)
    : m_options(std::move(options)),
      m_levelReader(levelReader),
      m_decoder(decoder),
      m_biomePreparer(std::move(biomePreparer)),
      m_regions(m_options.regionExtension) {
}

const char* WorldIndex::getErrorString(WorldIndexError error) {
    switch (error) {
        case WorldIndexError::None:                     return "no error";
        case WorldIndexError::MetadataUnreadable:       return "world metadata (level.dat) could not be read";
        case WorldIndexError::UnsupportedVersion:       return "unsupported world format, only McRegion worlds can be indexed";
        case WorldIndexError::RegionListUnreadable:     return "region list file could not be read";
        case WorldIndexError::NoRegionsFound:           return "no regions found";
        case WorldIndexError::RegionOpenFailed:         return "a region file could not be opened";
        case WorldIndexError::SpawnRegionMissing:       return "spawn lies outside all discovered regions";
        case WorldIndexError::SpawnChunkMissing:        return "spawn chunk has no data";
        case WorldIndexError::SpawnDecodeFailed:        return "spawn chunk could not be decoded";
        case WorldIndexError::PersistentDataUnreadable: return "metadata side-car file is malformed";
    }
    return "unknown error";
}

WorldIndexError WorldIndex::fail(WorldIndexError error) {
    m_lastError = error;
    Logger::error() << "World indexing failed for " << m_options.worldPath << ": " << getErrorString(error);
    return error;
}

std::string WorldIndex::getMetadataPath() const {
    return (fs::path(m_options.worldPath) / m_options.metadataFile).string();
}

WorldIndexError WorldIndex::initialize() {
    m_initialized = false;
    m_lastError = WorldIndexError::None;

    Logger::info() << "Indexing world " << m_options.worldPath;

    // Format check comes first: an old-format world has no region files to find
    if (!m_levelReader.read(m_options.worldPath, m_level)) {
        return fail(WorldIndexError::MetadataUnreadable);
    }
    if (!m_level.hasVersion || m_level.version != LevelFormat::REQUIRED_VERSION) {
        Logger::error() << "World version " << (m_level.hasVersion ? std::to_string(m_level.version) : "<none>")
                        << " is not supported (need " << LevelFormat::REQUIRED_VERSION << ")";
        return fail(WorldIndexError::UnsupportedVersion);
    }

    if (m_options.useBiomeData && m_biomePreparer) {
        m_biomePreparer(m_options.worldPath);
    }

    {
        std::lock_guard<std::mutex> lock(m_poiMutex);
        m_persistentUnreadable = !PersistentMetadataStore::load(getMetadataPath(), m_persistentState);
        if (m_persistentUnreadable) {
            return fail(WorldIndexError::PersistentDataUnreadable);
        }
        m_pointsOfInterest.clear();
    }

    // Discovery
    std::vector<std::string> listEntries;
    const std::vector<std::string>* explicitList = nullptr;
    if (m_options.useRegionList) {
        explicitList = &m_options.regionList;
    } else if (!m_options.regionListFile.empty()) {
        if (!RegionIndex::readRegionList(m_options.regionListFile, listEntries)) {
            return fail(WorldIndexError::RegionListUnreadable);
        }
        explicitList = &listEntries;
    }

    if (m_regions.discover(m_options.worldPath, explicitList) == 0) {
        return fail(WorldIndexError::NoRegionsFound);
    }

    if (!warmRegionCache()) {
        return fail(WorldIndexError::RegionOpenFailed);
    }

    if (!WorldBoundsScanner::computeBounds(m_regions.getRegionKeys(), m_bounds)) {
        return fail(WorldIndexError::NoRegionsFound);
    }

    PointOfInterest spawn;
    const SpawnStatus spawnStatus = SpawnLocator::locate(m_level, m_regions, m_cache, m_decoder, spawn);
    Logger::debug() << "Spawn lookup: " << SpawnLocator::statusName(spawnStatus);
    switch (spawnStatus) {
        case SpawnStatus::Found:
            break;
        case SpawnStatus::RegionMissing:
            return fail(WorldIndexError::SpawnRegionMissing);
        case SpawnStatus::ChunkMissing:
            return fail(WorldIndexError::SpawnChunkMissing);
        case SpawnStatus::DecodeFailed:
            return fail(WorldIndexError::SpawnDecodeFailed);
    }
    addPointOfInterest(std::move(spawn));

    m_initialized = true;
    Logger::info() << "Indexed \"" << m_level.levelName << "\": " << m_regions.size() << " regions, "
                   << m_cache.size() << " open";
    return WorldIndexError::None;
}

bool WorldIndex::warmRegionCache() {
    for (const auto& entry : m_regions.getRegions()) {
        if (m_cache.get(entry.second.path) == nullptr) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> WorldIndex::getRegionPath(int chunkX, int chunkY) const {
    return m_regions.getRegionPath(chunkX, chunkY);
}

std::shared_ptr<ChunkData> WorldIndex::loadChunk(const std::string& path, int chunkX, int chunkY) {
    std::optional<ChunkPayload> payload = m_cache.loadChunk(path, chunkX, chunkY);
    if (!payload) {
        return nullptr;
    }
    return m_decoder.decode(*payload);
}

void WorldIndex::addPointOfInterest(PointOfInterest poi) {
    std::lock_guard<std::mutex> lock(m_poiMutex);
    m_pointsOfInterest.push_back(std::move(poi));
}

std::vector<PointOfInterest> WorldIndex::getPointsOfInterest() const {
    std::lock_guard<std::mutex> lock(m_poiMutex);
    return m_pointsOfInterest;
}

void WorldIndex::addPersistentPointOfInterest(PointOfInterest poi) {
    std::lock_guard<std::mutex> lock(m_poiMutex);
    m_persistentState.pointsOfInterest.push_back(std::move(poi));
}

void WorldIndex::setPersistentExtension(const std::string& key, const YAML::Node& value) {
    std::lock_guard<std::mutex> lock(m_poiMutex);
    // Node assignment rebinds shared content, so replace the entry instead
    m_persistentState.extensions.erase(key);
    m_persistentState.extensions.emplace(key, YAML::Clone(value));
}

PersistentState WorldIndex::getPersistentState() const {
    std::lock_guard<std::mutex> lock(m_poiMutex);
    return m_persistentState;
}

bool WorldIndex::save() const {
    std::lock_guard<std::mutex> lock(m_poiMutex);
    if (m_persistentUnreadable) {
        Logger::error() << "Not saving over unreadable metadata file " << getMetadataPath();
        return false;
    }
    return PersistentMetadataStore::save(getMetadataPath(), m_persistentState);
}
