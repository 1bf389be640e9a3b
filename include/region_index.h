/**
 * @file region_index.h
 * @brief Discovery of region container files and region -> path lookup
 *
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "world_constants.h"

/**
 * @brief Region grid coordinate, key of the region map
 */
struct RegionKey {
    int x, y;

    bool operator==(const RegionKey& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const RegionKey& other) const {
        return !(*this == other);
    }
};

namespace std {
    template<>
    struct hash<RegionKey> {
        size_t operator()(const RegionKey& key) const {
            size_t h1 = hash<int>()(key.x);
            size_t h2 = hash<int>()(key.y);
            return h1 ^ (h2 << 1);
        }
    };
}

/**
 * @brief One discovered region container
 */
struct RegionFileRecord {
    int regionX;
    int regionY;
    std::string path;
};

using RegionMap = std::unordered_map<RegionKey, RegionFileRecord>;

/**
 * @brief One directory as seen by the filesystem walk
 *
 * Separates "what is on disk" from "which files qualify", so the
 * qualification rules can be exercised with a hand-built listing.
 */
struct DirectoryListing {
    std::string path;                    ///< Directory path
    bool hasSubdirectories = false;      ///< True if any entry is a directory
    std::vector<std::string> fileNames;  ///< Regular files (names only)
};

/**
 * @brief Maps region coordinates to region container paths
 *
 * Region files are named r.<regionX>.<regionY>.<ext> and live under
 * <worldRoot>/region, optionally one directory deeper. A chunk (cx, cy)
 * belongs to region (floor(cx / 32), floor(cy / 32)).
 *
 * Discovery runs once during WorldIndex initialization; afterwards the index
 * is read-only and lookups are safe from any thread.
 *
 * @note Two files with the same coordinates (e.g. in two subdirectories) are
 *       not reported; the one discovered last replaces the other.
 */
class RegionIndex {
public:
    explicit RegionIndex(std::string extension = RegionLayout::DEFAULT_EXTENSION);

    // ========== Discovery ==========

    /**
     * @brief Populates the index for a world
     *
     * With an explicit list, each entry names a region file (only the file
     * name is used; it is resolved against <worldRoot>/region and need not
     * exist). Without one, <worldRoot>/region is walked on disk.
     *
     * Replaces any previous contents.
     *
     * @param worldRoot World directory (contains level.dat and region/)
     * @param explicitList Optional precomputed list of region paths
     * @return Number of indexed regions
     */
    size_t discover(const std::string& worldRoot,
                    const std::vector<std::string>* explicitList = nullptr);

    /**
     * @brief Parses a region file name
     *
     * @param fileName Name without directory, e.g. "r.-1.0.mcr"
     * @param regionX Receives the X coordinate on success
     * @param regionY Receives the Y coordinate on success
     * @return True if the name is r.<int>.<int>.<extension> with both
     *         coordinates within +-RegionLayout::MAX_REGION_COORD
     */
    bool parseRegionFileName(const std::string& fileName, int& regionX, int& regionY) const;

    /**
     * @brief Builds records from full paths of candidate files
     *
     * Non-matching names are skipped. Later duplicates overwrite earlier ones.
     */
    RegionMap buildFromPaths(const std::vector<std::string>& paths) const;

    /**
     * @brief Builds records from an explicit region list
     *
     * Trailing "\n" / "\r\n" is stripped from each entry before matching.
     */
    RegionMap buildFromList(const std::string& worldRoot,
                            const std::vector<std::string>& entries) const;

    /**
     * @brief Applies the leaf-directory rules to a directory listing
     *
     * A directory qualifies when it has no subdirectories, contains at least
     * one file and has no DIM-1 component in its path.
     *
     * @return Full paths of every file in qualifying directories
     */
    static std::vector<std::string> selectCandidateFiles(const std::vector<DirectoryListing>& listing);

    /**
     * @brief Walks a directory tree and describes every directory in it
     *
     * Unreadable directories are logged and skipped. A missing root yields
     * an empty listing.
     */
    static std::vector<DirectoryListing> listDirectories(const std::string& root);

    /**
     * @brief Reads an explicit region list file, one entry per line
     *
     * Blank lines are dropped.
     *
     * @return False if the file cannot be opened
     */
    static bool readRegionList(const std::string& listPath, std::vector<std::string>& entries);

    // ========== Lookup ==========

    /**
     * @brief Path of the region file holding a chunk
     * @return The path, or std::nullopt if the region was never discovered
     */
    std::optional<std::string> getRegionPath(int chunkX, int chunkY) const;

    const RegionFileRecord* getRecord(int regionX, int regionY) const;

    const RegionMap& getRegions() const { return m_regions; }

    /**
     * @brief Region keys in unspecified order
     */
    std::vector<RegionKey> getRegionKeys() const;

    size_t size() const { return m_regions.size(); }
    bool empty() const { return m_regions.empty(); }

    const std::string& getExtension() const { return m_extension; }

private:
    std::string m_extension;  ///< Extension without the dot
    RegionMap m_regions;
};
