#include "region_reader.h"
#include "logger.h"
#include "world_utils.h"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

uint32_t readBigEndian32(const uint8_t* bytes) {
    return (static_cast<uint32_t>(bytes[0]) << 24) |
           (static_cast<uint32_t>(bytes[1]) << 16) |
           (static_cast<uint32_t>(bytes[2]) << 8) |
           static_cast<uint32_t>(bytes[3]);
}

}  // namespace

std::unique_ptr<RegionReader> RegionReader::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        Logger::error() << "Failed to open region file " << path << ": " << std::strerror(errno);
        return nullptr;
    }

    struct stat st;
    if (fstat(fd, &st) != 0) {
        Logger::error() << "Failed to stat region file " << path << ": " << std::strerror(errno);
        ::close(fd);
        return nullptr;
    }

    // From here on the descriptor belongs to the reader
    std::unique_ptr<RegionReader> reader(
        new RegionReader(path, fd, static_cast<uint64_t>(st.st_size)));
    if (!reader->readHeader()) {
        return nullptr;
    }
    return reader;
}

RegionReader::RegionReader(std::string path, int fd, uint64_t fileSize)
    : m_path(std::move(path)), m_fd(fd), m_fileSize(fileSize) {
}

RegionReader::~RegionReader() {
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

bool RegionReader::readHeader() {
    // The game creates empty region files before writing any chunk
    if (m_fileSize == 0) {
        Logger::debug() << "Region file " << m_path << " is empty";
        return true;
    }

    if (m_fileSize < RegionLayout::HEADER_BYTES) {
        Logger::error() << "Region file " << m_path << " has a truncated header ("
                        << m_fileSize << " bytes)";
        return false;
    }

    std::array<uint8_t, RegionLayout::HEADER_BYTES> header;
    if (!readAt(0, header.data(), header.size())) {
        Logger::error() << "Failed to read header of region file " << m_path;
        return false;
    }

    for (int i = 0; i < RegionLayout::REGION_SLOTS; i++) {
        m_locations[i] = readBigEndian32(&header[i * 4]);
        m_timestamps[i] = readBigEndian32(&header[RegionLayout::SECTOR_BYTES + i * 4]);
    }

    Logger::debug() << "Parsed region header " << m_path << " (" << getChunkCount() << " chunks)";
    return true;
}

bool RegionReader::readAt(uint64_t offset, void* buffer, size_t length) const {
    uint8_t* out = static_cast<uint8_t*>(buffer);
    size_t done = 0;
    while (done < length) {
        ssize_t n = ::pread(m_fd, out + done, length - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::error() << "Read error in " << m_path << ": " << std::strerror(errno);
            return false;
        }
        if (n == 0) {
            return false;  // Unexpected end of file
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

int RegionReader::slotIndex(int chunkX, int chunkY) {
    return floorMod(chunkX, RegionLayout::REGION_CHUNKS) +
           floorMod(chunkY, RegionLayout::REGION_CHUNKS) * RegionLayout::REGION_CHUNKS;
}

bool RegionReader::hasChunk(int chunkX, int chunkY) const {
    return m_locations[slotIndex(chunkX, chunkY)] != 0;
}

uint32_t RegionReader::getChunkTimestamp(int chunkX, int chunkY) const {
    return m_timestamps[slotIndex(chunkX, chunkY)];
}

int RegionReader::getChunkCount() const {
    int count = 0;
    for (uint32_t location : m_locations) {
        if (location != 0) {
            count++;
        }
    }
    return count;
}

std::optional<ChunkPayload> RegionReader::loadChunk(int chunkX, int chunkY) const {
    const uint32_t location = m_locations[slotIndex(chunkX, chunkY)];
    if (location == 0) {
        return std::nullopt;
    }

    const uint64_t sectorOffset = location >> 8;
    const uint64_t sectorCount = location & 0xFF;
    const uint64_t recordStart = sectorOffset * RegionLayout::SECTOR_BYTES;
    const uint64_t recordCapacity = sectorCount * RegionLayout::SECTOR_BYTES;

    if (sectorOffset < RegionLayout::HEADER_BYTES / RegionLayout::SECTOR_BYTES ||
        recordStart + RegionLayout::CHUNK_RECORD_PREFIX > m_fileSize) {
        Logger::warning() << "Chunk (" << chunkX << ", " << chunkY << ") in " << m_path
                          << " points at sector " << sectorOffset << " outside the data area";
        return std::nullopt;
    }

    uint8_t prefix[RegionLayout::CHUNK_RECORD_PREFIX];
    if (!readAt(recordStart, prefix, sizeof(prefix))) {
        Logger::warning() << "Failed to read chunk record (" << chunkX << ", " << chunkY << ") in " << m_path;
        return std::nullopt;
    }

    // Length counts the compression byte but not itself
    const uint64_t length = readBigEndian32(prefix);
    if (length == 0 ||
        length + 4 > recordCapacity ||
        recordStart + 4 + length > m_fileSize) {
        Logger::warning() << "Chunk (" << chunkX << ", " << chunkY << ") in " << m_path
                          << " declares " << length << " bytes, beyond its "
                          << sectorCount << " sectors or the end of the file";
        return std::nullopt;
    }

    ChunkPayload payload;
    payload.compression = prefix[4];
    payload.data.resize(static_cast<size_t>(length - 1));
    if (!payload.data.empty() &&
        !readAt(recordStart + RegionLayout::CHUNK_RECORD_PREFIX, payload.data.data(), payload.data.size())) {
        Logger::warning() << "Short read of chunk (" << chunkX << ", " << chunkY << ") in " << m_path;
        return std::nullopt;
    }

    Logger::debug() << "Read chunk (" << chunkX << ", " << chunkY << ") from " << m_path
                    << ": " << payload.data.size() << " bytes";
    return payload;
}
