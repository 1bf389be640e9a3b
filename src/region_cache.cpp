#include "region_cache.h"
#include "logger.h"

#include <mutex>

RegionReader* RegionCache::get(const std::string& path) {
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_readers.find(path);
        if (it != m_readers.end()) {
            return it->second.get();
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);

    // Another thread may have opened it between the two locks
    auto it = m_readers.find(path);
    if (it != m_readers.end()) {
        return it->second.get();
    }

    std::unique_ptr<RegionReader> reader = RegionReader::open(path);
    if (!reader) {
        return nullptr;
    }

    m_headerParseCount++;
    RegionReader* raw = reader.get();
    m_readers.emplace(path, std::move(reader));
    Logger::debug() << "Cached region reader for " << path << " (" << m_readers.size() << " open)";
    return raw;
}

std::optional<ChunkPayload> RegionCache::loadChunk(const std::string& path, int chunkX, int chunkY) {
    RegionReader* reader = get(path);
    if (reader == nullptr) {
        return std::nullopt;
    }
    return reader->loadChunk(chunkX, chunkY);
}

bool RegionCache::contains(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_readers.find(path) != m_readers.end();
}

size_t RegionCache::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_readers.size();
}
