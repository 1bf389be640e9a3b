/**
 * @file world_constants.h
 * @brief Fixed dimensions of chunks, region containers and the level format
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace ChunkLayout {
    /// Blocks along local X (east-west)
    constexpr int CHUNK_WIDTH = 16;
    /// Blocks along local Z (north-south)
    constexpr int CHUNK_DEPTH = 16;
    /// Blocks along Y; the voxel volume ceiling
    constexpr int CHUNK_HEIGHT = 128;
    /// Bytes in a dense block-id volume (one byte per voxel)
    constexpr size_t CHUNK_VOLUME = static_cast<size_t>(CHUNK_WIDTH) * CHUNK_DEPTH * CHUNK_HEIGHT;

    /// Block id of air; everything else counts as solid
    constexpr uint8_t BLOCK_AIR = 0;
}

namespace RegionLayout {
    /// Chunks per region along each horizontal axis
    constexpr int REGION_CHUNKS = 32;
    /// Location-table slots (32 x 32)
    constexpr int REGION_SLOTS = REGION_CHUNKS * REGION_CHUNKS;
    /// Allocation unit of a region container
    constexpr size_t SECTOR_BYTES = 4096;
    /// Location table followed by the timestamp table
    constexpr size_t HEADER_BYTES = 2 * SECTOR_BYTES;
    /// Per-chunk record prefix: 4-byte length + 1-byte compression type
    constexpr size_t CHUNK_RECORD_PREFIX = 5;

    /// Compression ids stored in the record prefix
    constexpr uint8_t COMPRESSION_GZIP = 1;
    constexpr uint8_t COMPRESSION_ZLIB = 2;

    /// Largest accepted |region coordinate|; chunk coordinates and their
    /// diagonal sums stay well inside int range
    constexpr int MAX_REGION_COORD = 1 << 24;

    /// Default extension of region container files (r.<x>.<y>.mcr)
    constexpr const char* DEFAULT_EXTENSION = "mcr";

    /// Path component marking the alternate (nether) dimension, never indexed
    constexpr const char* ALTERNATE_DIMENSION_DIR = "DIM-1";
}

namespace LevelFormat {
    /// The only world format version this indexer accepts (McRegion)
    constexpr int REQUIRED_VERSION = 19132;

    /// Side-car file holding points of interest between runs
    constexpr const char* DEFAULT_METADATA_FILE = "overviewer.dat";
}
