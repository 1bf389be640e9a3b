/**
 * @file region_cache.h
 * @brief Keeps one open RegionReader per region file path
 *
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "region_reader.h"

/**
 * @brief Cache of open region containers keyed by path
 *
 * Opening a region parses its 8 KB header, so each path is opened once and
 * the reader kept for the lifetime of the cache. There is no eviction: a
 * world with N region files holds N open descriptors until the owning
 * WorldIndex is destroyed.
 *
 * Thread safety: lookups take a shared lock, a miss takes the exclusive lock
 * and re-checks before opening. Returned readers stay valid as long as the
 * cache lives.
 */
class RegionCache {
public:
    RegionCache() = default;

    RegionCache(const RegionCache&) = delete;
    RegionCache& operator=(const RegionCache&) = delete;

    /**
     * @brief Returns the reader for a path, opening it on first use
     * @return Reader owned by the cache, or nullptr if the file could not be opened
     */
    RegionReader* get(const std::string& path);

    /**
     * @brief Reads a chunk through the cached reader for a path
     *
     * @return The raw payload, or std::nullopt if the slot is empty or the
     *         region cannot be opened
     */
    std::optional<ChunkPayload> loadChunk(const std::string& path, int chunkX, int chunkY);

    /**
     * @brief True if a reader for the path is already open
     */
    bool contains(const std::string& path) const;

    /**
     * @brief Number of open readers
     */
    size_t size() const;

    /**
     * @brief Number of region headers parsed so far (successful opens)
     */
    size_t getHeaderParseCount() const { return m_headerParseCount.load(); }

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<RegionReader>> m_readers;
    std::atomic<size_t> m_headerParseCount{0};
};
