/**
 * @file test_region_cache.cpp
 * @brief Region container parsing and the per-path reader cache
 *
 * Tests:
 * 1. Header parsing and chunk payload reads
 * 2. Empty and truncated containers
 * 3. Records pointing outside the file are reported absent
 * 4. One reader per path, header parsed once
 * 5. Concurrent reads through one shared reader
 */

#include "test_utils.h"
#include "region_cache.h"

#include <atomic>
#include <thread>

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> patternBytes(size_t size, uint8_t seed) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; i++) {
        data[i] = static_cast<uint8_t>(seed + i * 7);
    }
    return data;
}

}  // namespace

// ============================================================
// RegionReader
// ============================================================

TEST(ReaderParsesHeaderAndReadsChunks) {
    TempDirectory dir;
    const fs::path path = dir.path() / "r.0.0.mcr";

    std::vector<uint8_t> small = patternBytes(100, 1);
    std::vector<uint8_t> large = patternBytes(9000, 2);  // spans three sectors
    RegionFileBuilder()
        .addChunk(0, 0, small)
        .addChunk(31, 31, large, RegionLayout::COMPRESSION_GZIP, 42)
        .write(path);

    auto reader = RegionReader::open(path.string());
    ASSERT_NOT_NULL(reader.get());
    ASSERT_EQ(reader->getPath(), path.string());
    ASSERT_EQ(reader->getFileSize(), static_cast<uint64_t>(fs::file_size(path)));
    ASSERT_EQ(reader->getChunkCount(), 2);
    ASSERT_TRUE(reader->hasChunk(0, 0));
    ASSERT_TRUE(reader->hasChunk(31, 31));
    ASSERT_FALSE(reader->hasChunk(1, 0));
    ASSERT_EQ(reader->getChunkTimestamp(31, 31), 42u);

    auto first = reader->loadChunk(0, 0);
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first->compression, RegionLayout::COMPRESSION_ZLIB);
    ASSERT_EQ(first->data, small);

    auto second = reader->loadChunk(31, 31);
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(second->compression, RegionLayout::COMPRESSION_GZIP);
    ASSERT_EQ(second->data, large);
}

TEST(ReaderUsesRegionLocalSlots) {
    TempDirectory dir;
    const fs::path path = dir.path() / "r.-1.-1.mcr";

    std::vector<uint8_t> data = patternBytes(10, 9);
    RegionFileBuilder().addChunk(-1, -32, data).write(path);

    auto reader = RegionReader::open(path.string());
    ASSERT_NOT_NULL(reader.get());
    ASSERT_EQ(RegionReader::slotIndex(-1, -32), 31);
    ASSERT_EQ(RegionReader::slotIndex(31, 0), 31);
    ASSERT_EQ(RegionReader::slotIndex(5, 2), 5 + 2 * 32);

    auto payload = reader->loadChunk(-1, -32);
    ASSERT_TRUE(payload.has_value());
    ASSERT_EQ(payload->data, data);
}

TEST(EmptySlotIsAbsent) {
    TempDirectory dir;
    const fs::path path = dir.path() / "r.0.0.mcr";
    RegionFileBuilder().addChunk(3, 4, patternBytes(16, 0)).write(path);

    auto reader = RegionReader::open(path.string());
    ASSERT_NOT_NULL(reader.get());
    ASSERT_FALSE(reader->loadChunk(4, 3).has_value());
}

TEST(ZeroLengthRegionHasNoChunks) {
    TempDirectory dir;
    fs::path path = dir.writeFile("r.0.0.mcr", "");

    auto reader = RegionReader::open(path.string());
    ASSERT_NOT_NULL(reader.get());
    ASSERT_EQ(reader->getChunkCount(), 0);
    ASSERT_FALSE(reader->loadChunk(0, 0).has_value());
}

TEST(TruncatedHeaderFailsToOpen) {
    ScopedLogCapture capture(LogLevel::ERROR);
    TempDirectory dir;
    fs::path path = dir.writeFile("r.0.0.mcr", std::string(100, '\0'));

    ASSERT_NULL(RegionReader::open(path.string()));
    ASSERT_TRUE(capture.contains("truncated header"));
}

TEST(MissingFileFailsToOpen) {
    ScopedLogCapture quiet(LogLevel::ERROR);
    TempDirectory dir;
    ASSERT_NULL(RegionReader::open((dir.path() / "r.0.0.mcr").string()));
}

TEST(RecordsOutsideFileAreAbsent) {
    ScopedLogCapture capture(LogLevel::WARNING);
    TempDirectory dir;
    const fs::path path = dir.path() / "r.0.0.mcr";

    RegionFileBuilder builder;
    builder.addChunk(0, 0, patternBytes(10, 3));
    builder.setLocation(1, 0, 50, 1);   // far past the end of the file
    builder.setLocation(2, 0, 0, 1);    // inside the header
    builder.write(path);

    auto reader = RegionReader::open(path.string());
    ASSERT_NOT_NULL(reader.get());
    ASSERT_TRUE(reader->loadChunk(0, 0).has_value());
    ASSERT_FALSE(reader->loadChunk(1, 0).has_value());
    ASSERT_FALSE(reader->loadChunk(2, 0).has_value());
    ASSERT_TRUE(capture.contains("outside the data area"));
}

TEST(OversizedLengthIsAbsent) {
    ScopedLogCapture capture(LogLevel::WARNING);
    TempDirectory dir;
    const fs::path path = dir.path() / "r.0.0.mcr";

    RegionFileBuilder builder;
    builder.addChunk(0, 0, patternBytes(10, 3));
    std::vector<uint8_t> bytes = builder.bytes();
    // Claim 1 MB in a one-sector record
    bytes[RegionLayout::HEADER_BYTES + 0] = 0x00;
    bytes[RegionLayout::HEADER_BYTES + 1] = 0x10;
    bytes[RegionLayout::HEADER_BYTES + 2] = 0x00;
    bytes[RegionLayout::HEADER_BYTES + 3] = 0x00;

    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();

    auto reader = RegionReader::open(path.string());
    ASSERT_NOT_NULL(reader.get());
    ASSERT_FALSE(reader->loadChunk(0, 0).has_value());
    ASSERT_TRUE(capture.contains("declares"));
}

// ============================================================
// RegionCache
// ============================================================

TEST(CacheReturnsSameReaderAndParsesOnce) {
    TempDirectory dir;
    const fs::path path = dir.path() / "r.0.0.mcr";
    RegionFileBuilder().addChunk(0, 0, patternBytes(8, 0)).write(path);

    RegionCache cache;
    RegionReader* first = cache.get(path.string());
    RegionReader* second = cache.get(path.string());

    ASSERT_NOT_NULL(first);
    ASSERT_EQ(first, second);
    ASSERT_EQ(cache.size(), 1u);
    ASSERT_EQ(cache.getHeaderParseCount(), 1u);
    ASSERT_TRUE(cache.contains(path.string()));
}

TEST(CacheKeepsOneReaderPerPath) {
    TempDirectory dir;
    const fs::path a = dir.path() / "r.0.0.mcr";
    const fs::path b = dir.path() / "r.1.0.mcr";
    RegionFileBuilder().write(a);
    RegionFileBuilder().write(b);

    RegionCache cache;
    ASSERT_NE(cache.get(a.string()), cache.get(b.string()));
    cache.get(a.string());
    cache.get(b.string());
    ASSERT_EQ(cache.size(), 2u);
    ASSERT_EQ(cache.getHeaderParseCount(), 2u);
}

TEST(CacheDoesNotStoreFailedOpens) {
    ScopedLogCapture quiet(LogLevel::ERROR);
    TempDirectory dir;
    const std::string missing = (dir.path() / "r.4.4.mcr").string();

    RegionCache cache;
    ASSERT_NULL(cache.get(missing));
    ASSERT_EQ(cache.size(), 0u);
    ASSERT_FALSE(cache.loadChunk(missing, 0, 0).has_value());
}

TEST(CacheLoadChunkDelegates) {
    TempDirectory dir;
    const fs::path path = dir.path() / "r.0.0.mcr";
    std::vector<uint8_t> data = patternBytes(33, 5);
    RegionFileBuilder().addChunk(7, 9, data).write(path);

    RegionCache cache;
    auto payload = cache.loadChunk(path.string(), 7, 9);
    ASSERT_TRUE(payload.has_value());
    ASSERT_EQ(payload->data, data);
    ASSERT_FALSE(cache.loadChunk(path.string(), 9, 7).has_value());
    ASSERT_EQ(cache.getHeaderParseCount(), 1u);
}

TEST(ConcurrentReadsShareOneReader) {
    TempDirectory dir;
    const fs::path path = dir.path() / "r.0.0.mcr";

    RegionFileBuilder builder;
    for (int i = 0; i < 32; i++) {
        builder.addChunk(i, i, patternBytes(500 + i * 37, static_cast<uint8_t>(i)));
    }
    builder.write(path);

    RegionCache cache;
    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; t++) {
        workers.emplace_back([&cache, &path, &mismatches, t]() {
            for (int round = 0; round < 50; round++) {
                int i = (t * 7 + round) % 32;
                auto payload = cache.loadChunk(path.string(), i, i);
                if (!payload || payload->data != patternBytes(500 + i * 37, static_cast<uint8_t>(i))) {
                    mismatches++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    ASSERT_EQ(mismatches.load(), 0);
    ASSERT_EQ(cache.getHeaderParseCount(), 1u);
    std::cout << "  ✓ 400 concurrent reads through one reader\n";
}

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
