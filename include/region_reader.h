/**
 * @file region_reader.h
 * @brief Read access to one region container file
 *
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "world_constants.h"

/**
 * @brief Raw bytes of one chunk as stored in a region container
 *
 * The data is still compressed; turning it into a structured chunk is the
 * ChunkDecoder's job.
 */
struct ChunkPayload {
    uint8_t compression = 0;    ///< RegionLayout::COMPRESSION_* id
    std::vector<uint8_t> data;  ///< Compressed chunk bytes
};

/**
 * @brief One open region container plus its parsed location table
 *
 * Container layout (all integers big-endian):
 * - 1024 x uint32 locations: (sector offset << 8) | sector count, 0 = empty
 * - 1024 x uint32 last-modified timestamps
 * - chunk records at offset * 4096: uint32 length, uint8 compression,
 *   length - 1 bytes of data
 *
 * The header is parsed once in open(). All later reads go through pread()
 * on the shared descriptor, so any number of threads may call loadChunk()
 * concurrently without locking.
 *
 * Instances are owned by RegionCache and never copied.
 */
class RegionReader {
public:
    /**
     * @brief Opens a container and parses its header
     *
     * A zero-length file is accepted as a region with no chunks.
     *
     * @param path Region file path
     * @return The reader, or nullptr if the file cannot be opened or its
     *         header is truncated (errors are logged)
     */
    static std::unique_ptr<RegionReader> open(const std::string& path);

    ~RegionReader();

    RegionReader(const RegionReader&) = delete;
    RegionReader& operator=(const RegionReader&) = delete;

    /**
     * @brief True if the location table has an entry for the chunk
     *
     * Chunk coordinates are global; only their position within the region
     * (floor modulo 32) is used.
     */
    bool hasChunk(int chunkX, int chunkY) const;

    /**
     * @brief Reads a chunk record
     *
     * @return The payload, or std::nullopt when the slot is empty or the
     *         record lies outside the file (the latter is logged)
     */
    std::optional<ChunkPayload> loadChunk(int chunkX, int chunkY) const;

    /**
     * @brief Last-modified timestamp stored for a chunk slot (0 if none)
     */
    uint32_t getChunkTimestamp(int chunkX, int chunkY) const;

    /**
     * @brief Number of populated slots in the location table
     */
    int getChunkCount() const;

    const std::string& getPath() const { return m_path; }
    uint64_t getFileSize() const { return m_fileSize; }

    /**
     * @brief Location-table index of a chunk, (x mod 32) + (y mod 32) * 32
     */
    static int slotIndex(int chunkX, int chunkY);

private:
    RegionReader(std::string path, int fd, uint64_t fileSize);

    bool readHeader();
    bool readAt(uint64_t offset, void* buffer, size_t length) const;

    std::string m_path;
    int m_fd;
    uint64_t m_fileSize;

    std::array<uint32_t, RegionLayout::REGION_SLOTS> m_locations{};
    std::array<uint32_t, RegionLayout::REGION_SLOTS> m_timestamps{};
};
