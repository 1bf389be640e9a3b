#pragma once

/**
 * @file test_utils.h
 * @brief Assertion macros, test registration and world fixtures
 *
 * No external test framework: each test executable registers TEST()s and
 * calls run_all_tests() from main(), which throws if anything failed.
 */

#include <iostream>
#include <stdexcept>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "logger.h"
#include "world_collaborators.h"
#include "world_constants.h"
#include "region_reader.h"

// ============================================================
// Test Assertion Macros
// ============================================================

#define ASSERT_TRUE(condition) \
    do { \
        if (!(condition)) { \
            throw std::runtime_error(std::string(__FILE__) + ":" + std::to_string(__LINE__) + \
                                   " ASSERT_TRUE failed: " #condition); \
        } \
    } while(0)

#define ASSERT_FALSE(condition) ASSERT_TRUE(!(condition))

#define ASSERT_EQ(a, b) \
    do { \
        if ((a) != (b)) { \
            throw std::runtime_error(std::string(__FILE__) + ":" + std::to_string(__LINE__) + \
                                   " ASSERT_EQ failed: " #a " != " #b); \
        } \
    } while(0)

#define ASSERT_NE(a, b) ASSERT_TRUE((a) != (b))

#define ASSERT_LT(a, b) ASSERT_TRUE((a) < (b))
#define ASSERT_LE(a, b) ASSERT_TRUE((a) <= (b))
#define ASSERT_GT(a, b) ASSERT_TRUE((a) > (b))
#define ASSERT_GE(a, b) ASSERT_TRUE((a) >= (b))

#define ASSERT_NULL(ptr) ASSERT_TRUE((ptr) == nullptr)
#define ASSERT_NOT_NULL(ptr) ASSERT_TRUE((ptr) != nullptr)

#define ASSERT_THROWS(expression) \
    do { \
        bool threw_ = false; \
        try { \
            expression; \
        } catch (const std::exception&) { \
            threw_ = true; \
        } \
        if (!threw_) { \
            throw std::runtime_error(std::string(__FILE__) + ":" + std::to_string(__LINE__) + \
                                   " ASSERT_THROWS failed: " #expression); \
        } \
    } while(0)

// ============================================================
// Test Results Tracking
// ============================================================

struct TestResult {
    std::string name;
    bool passed;
    std::string error;
    double duration_ms;
};

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner runner;
        return runner;
    }

    void add_result(const TestResult& result) {
        results.push_back(result);
    }

    void print_summary() {
        std::cout << "\n========================================\n";
        std::cout << "TEST SUMMARY\n";
        std::cout << "========================================\n";

        int passed = 0, failed = 0;
        double total_time = 0.0;

        for (const auto& result : results) {
            if (result.passed) {
                std::cout << "✓ " << result.name << " (" << result.duration_ms << " ms)\n";
                passed++;
            } else {
                std::cout << "✗ " << result.name << " (" << result.duration_ms << " ms)\n";
                std::cout << "  ERROR: " << result.error << "\n";
                failed++;
            }
            total_time += result.duration_ms;
        }

        std::cout << "\n" << passed << " passed, " << failed << " failed\n";
        std::cout << "Total time: " << total_time << " ms\n";
        std::cout << "========================================\n";

        if (failed > 0) {
            throw std::runtime_error(std::to_string(failed) + " test(s) failed");
        }
    }

private:
    std::vector<TestResult> results;
};

// ============================================================
// Test Macros for Running Tests
// ============================================================

inline std::vector<std::pair<std::string, void(*)()>>& registered_tests() {
    static std::vector<std::pair<std::string, void(*)()>> tests;
    return tests;
}

inline void register_test(const std::string& name, void (*fn)()) {
    registered_tests().push_back({name, fn});
}

#define TEST(test_name) \
    void test_##test_name(); \
    namespace { \
        struct TestRunner_##test_name { \
            TestRunner_##test_name() { \
                register_test(#test_name, &test_##test_name); \
            } \
        } runner_##test_name; \
    } \
    void test_##test_name()

inline void run_all_tests() {
    for (const auto& [name, fn] : registered_tests()) {
        TestResult result;
        result.name = name;

        auto start = std::chrono::high_resolution_clock::now();
        try {
            fn();
            result.passed = true;
        } catch (const std::exception& e) {
            result.passed = false;
            result.error = e.what();
        }
        auto end = std::chrono::high_resolution_clock::now();
        result.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();

        TestRunner::instance().add_result(result);
    }

    TestRunner::instance().print_summary();
}

// ============================================================
// Log Capture
// ============================================================

/**
 * @brief Routes all log output into a string for the lifetime of the object
 */
class ScopedLogCapture {
public:
    explicit ScopedLogCapture(LogLevel level = LogLevel::DEBUG)
        : m_previousLevel(Logger::getMinLevel()) {
        Logger::setMinLevel(level);
        Logger::setOutput(&m_buffer);
    }

    ~ScopedLogCapture() {
        Logger::setOutput(nullptr);
        Logger::setMinLevel(m_previousLevel);
    }

    std::string text() const { return m_buffer.str(); }

    bool contains(const std::string& needle) const {
        return m_buffer.str().find(needle) != std::string::npos;
    }

private:
    std::ostringstream m_buffer;
    LogLevel m_previousLevel;
};

// ============================================================
// Scratch Directories
// ============================================================

/**
 * @brief Unique directory under the system temp dir, removed on destruction
 */
class TempDirectory {
public:
    TempDirectory() {
        std::random_device rd;
        std::mt19937_64 rng(rd());
        m_path = std::filesystem::temp_directory_path() /
                 ("mapindex_test_" + std::to_string(rng()));
        std::filesystem::create_directories(m_path);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string str() const { return m_path.string(); }

    /**
     * @brief Creates a subdirectory (and parents) and returns its path
     */
    std::filesystem::path makeDir(const std::string& relative) const {
        std::filesystem::path dir = m_path / relative;
        std::filesystem::create_directories(dir);
        return dir;
    }

    /**
     * @brief Writes a file (creating parent directories)
     */
    std::filesystem::path writeFile(const std::string& relative, const std::string& contents) const {
        std::filesystem::path file = m_path / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << contents;
        return file;
    }

private:
    std::filesystem::path m_path;
};

// ============================================================
// Region Container Builder
// ============================================================

/**
 * @brief Assembles a region container in memory and writes it to disk
 *
 * Chunks are appended one after another, each padded to whole sectors.
 */
class RegionFileBuilder {
public:
    RegionFileBuilder() : m_bytes(RegionLayout::HEADER_BYTES, 0) {}

    /**
     * @brief Appends a chunk record and points the chunk's slot at it
     */
    RegionFileBuilder& addChunk(int chunkX, int chunkY, const std::vector<uint8_t>& data,
                                uint8_t compression = RegionLayout::COMPRESSION_ZLIB,
                                uint32_t timestamp = 1296000000) {
        const size_t sector = m_bytes.size() / RegionLayout::SECTOR_BYTES;
        const uint32_t length = static_cast<uint32_t>(data.size() + 1);

        appendBigEndian32(length);
        m_bytes.push_back(compression);
        m_bytes.insert(m_bytes.end(), data.begin(), data.end());

        // Pad to a sector boundary
        size_t padded = (m_bytes.size() + RegionLayout::SECTOR_BYTES - 1) / RegionLayout::SECTOR_BYTES
                        * RegionLayout::SECTOR_BYTES;
        m_bytes.resize(padded, 0);

        const uint32_t sectorCount = static_cast<uint32_t>(padded / RegionLayout::SECTOR_BYTES - sector);
        setLocation(chunkX, chunkY, static_cast<uint32_t>(sector), sectorCount);
        setTimestamp(chunkX, chunkY, timestamp);
        return *this;
    }

    /**
     * @brief Writes a location entry directly (for malformed headers)
     */
    RegionFileBuilder& setLocation(int chunkX, int chunkY, uint32_t sectorOffset, uint32_t sectorCount) {
        writeBigEndian32(static_cast<size_t>(RegionReader::slotIndex(chunkX, chunkY)) * 4,
                         (sectorOffset << 8) | (sectorCount & 0xFF));
        return *this;
    }

    RegionFileBuilder& setTimestamp(int chunkX, int chunkY, uint32_t timestamp) {
        writeBigEndian32(RegionLayout::SECTOR_BYTES +
                         static_cast<size_t>(RegionReader::slotIndex(chunkX, chunkY)) * 4, timestamp);
        return *this;
    }

    const std::vector<uint8_t>& bytes() const { return m_bytes; }

    void write(const std::filesystem::path& path) const {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(m_bytes.data()), static_cast<std::streamsize>(m_bytes.size()));
    }

private:
    void appendBigEndian32(uint32_t value) {
        m_bytes.push_back(static_cast<uint8_t>(value >> 24));
        m_bytes.push_back(static_cast<uint8_t>(value >> 16));
        m_bytes.push_back(static_cast<uint8_t>(value >> 8));
        m_bytes.push_back(static_cast<uint8_t>(value));
    }

    void writeBigEndian32(size_t offset, uint32_t value) {
        m_bytes[offset] = static_cast<uint8_t>(value >> 24);
        m_bytes[offset + 1] = static_cast<uint8_t>(value >> 16);
        m_bytes[offset + 2] = static_cast<uint8_t>(value >> 8);
        m_bytes[offset + 3] = static_cast<uint8_t>(value);
    }

    std::vector<uint8_t> m_bytes;
};

// ============================================================
// Block Volumes
// ============================================================

/**
 * @brief Dense 16x16x128 block volume in (x, z, y) order
 */
class BlockVolume {
public:
    explicit BlockVolume(uint8_t fill = ChunkLayout::BLOCK_AIR)
        : m_blocks(ChunkLayout::CHUNK_VOLUME, fill) {}

    void set(int x, int z, int y, uint8_t id) {
        m_blocks[(static_cast<size_t>(x) * ChunkLayout::CHUNK_DEPTH + z) * ChunkLayout::CHUNK_HEIGHT + y] = id;
    }

    /**
     * @brief Fills one column with id from y = 0 up to (excluding) top
     */
    void fillColumn(int x, int z, int top, uint8_t id) {
        for (int y = 0; y < top; y++) {
            set(x, z, y, id);
        }
    }

    const std::vector<uint8_t>& bytes() const { return m_blocks; }

private:
    std::vector<uint8_t> m_blocks;
};

// ============================================================
// Collaborator Doubles
// ============================================================

/**
 * @brief Chunk whose block volume is handed over verbatim
 */
class FakeChunkData : public ChunkData {
public:
    explicit FakeChunkData(std::vector<uint8_t> blocks) : m_blocks(std::move(blocks)) {}

    const std::vector<uint8_t>& getBlocks() const override { return m_blocks; }

private:
    std::vector<uint8_t> m_blocks;
};

/**
 * @brief Decoder for test regions: the payload bytes ARE the block volume
 *
 * Payloads with compression id FAKE_CORRUPT make decode() throw.
 */
class FakeChunkDecoder : public ChunkDecoder {
public:
    static constexpr uint8_t FAKE_CORRUPT = 0x7F;

    std::shared_ptr<ChunkData> decode(const ChunkPayload& payload) const override {
        m_decodeCount++;
        if (payload.compression == FAKE_CORRUPT) {
            throw std::runtime_error("corrupt chunk payload");
        }
        return std::make_shared<FakeChunkData>(payload.data);
    }

    int decodeCount() const { return m_decodeCount; }

private:
    mutable int m_decodeCount = 0;
};

/**
 * @brief level.dat stand-in returning fixed metadata
 */
class FakeLevelReader : public LevelMetadataReader {
public:
    FakeLevelReader() {
        metadata.hasVersion = true;
        metadata.version = LevelFormat::REQUIRED_VERSION;
        metadata.spawnX = 0;
        metadata.spawnY = 64;
        metadata.spawnZ = 0;
        metadata.levelName = "Test World";
    }

    bool read(const std::string& worldRoot, LevelMetadata& out) const override {
        m_readCount++;
        m_lastRoot = worldRoot;
        if (!readable) {
            return false;
        }
        out = metadata;
        return true;
    }

    int readCount() const { return m_readCount; }
    const std::string& lastRoot() const { return m_lastRoot; }

    LevelMetadata metadata;
    bool readable = true;

private:
    mutable int m_readCount = 0;
    mutable std::string m_lastRoot;
};
