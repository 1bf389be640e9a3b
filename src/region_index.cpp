#include "region_index.h"
#include "logger.h"
#include "world_utils.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace {

// Strict signed integer parse: the whole string must be consumed
bool parseSignedInt(const std::string& text, int& value) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(text, &consumed, 10);
        if (consumed != text.size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string stripLineTerminator(std::string entry) {
    while (!entry.empty() && (entry.back() == '\n' || entry.back() == '\r')) {
        entry.pop_back();
    }
    return entry;
}

bool isAlternateDimension(const fs::path& dir) {
    for (const auto& component : dir) {
        if (component == RegionLayout::ALTERNATE_DIMENSION_DIR) {
            return true;
        }
    }
    return false;
}

}  // namespace

RegionIndex::RegionIndex(std::string extension)
    : m_extension(std::move(extension)) {
}

bool RegionIndex::parseRegionFileName(const std::string& fileName, int& regionX, int& regionY) const {
    // r.<x>.<y>.<ext>
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = fileName.find('.', start);
        parts.push_back(fileName.substr(start, dot - start));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    if (parts.size() != 4 || parts[0] != "r" || parts[3] != m_extension) {
        return false;
    }

    int x, y;
    if (!parseSignedInt(parts[1], x) || !parseSignedInt(parts[2], y)) {
        return false;
    }

    if (x < -RegionLayout::MAX_REGION_COORD || x > RegionLayout::MAX_REGION_COORD ||
        y < -RegionLayout::MAX_REGION_COORD || y > RegionLayout::MAX_REGION_COORD) {
        Logger::debug() << "Region coordinates out of range in " << fileName;
        return false;
    }

    regionX = x;
    regionY = y;
    return true;
}

RegionMap RegionIndex::buildFromPaths(const std::vector<std::string>& paths) const {
    RegionMap regions;
    for (const auto& path : paths) {
        std::string fileName = fs::path(path).filename().string();
        int regionX, regionY;
        if (!parseRegionFileName(fileName, regionX, regionY)) {
            continue;
        }
        regions[RegionKey{regionX, regionY}] = RegionFileRecord{regionX, regionY, path};
    }
    return regions;
}

RegionMap RegionIndex::buildFromList(const std::string& worldRoot,
                                     const std::vector<std::string>& entries) const {
    const fs::path regionDir = fs::path(worldRoot) / "region";

    RegionMap regions;
    for (const auto& entry : entries) {
        std::string fileName = fs::path(stripLineTerminator(entry)).filename().string();
        int regionX, regionY;
        if (!parseRegionFileName(fileName, regionX, regionY)) {
            Logger::debug() << "Skipping region list entry: " << fileName;
            continue;
        }
        regions[RegionKey{regionX, regionY}] =
            RegionFileRecord{regionX, regionY, (regionDir / fileName).string()};
    }
    return regions;
}

std::vector<std::string> RegionIndex::selectCandidateFiles(const std::vector<DirectoryListing>& listing) {
    std::vector<std::string> files;
    for (const auto& dir : listing) {
        if (dir.hasSubdirectories || dir.fileNames.empty()) {
            continue;
        }
        if (isAlternateDimension(fs::path(dir.path))) {
            continue;
        }
        for (const auto& name : dir.fileNames) {
            files.push_back((fs::path(dir.path) / name).string());
        }
    }
    return files;
}

std::vector<DirectoryListing> RegionIndex::listDirectories(const std::string& root) {
    std::vector<DirectoryListing> listing;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        Logger::warning() << "Region directory not found: " << root;
        return listing;
    }

    std::vector<fs::path> pending{fs::path(root)};
    while (!pending.empty()) {
        fs::path dir = pending.back();
        pending.pop_back();

        DirectoryListing entry;
        entry.path = dir.string();

        fs::directory_iterator it(dir, ec);
        if (ec) {
            Logger::warning() << "Cannot read directory " << dir << ": " << ec.message();
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                Logger::warning() << "Error while reading " << dir << ": " << ec.message();
                break;
            }
            std::error_code typeEc;
            if (it->is_directory(typeEc)) {
                entry.hasSubdirectories = true;
                pending.push_back(it->path());
            } else if (it->is_regular_file(typeEc)) {
                entry.fileNames.push_back(it->path().filename().string());
            }
        }

        listing.push_back(std::move(entry));
    }

    return listing;
}

bool RegionIndex::readRegionList(const std::string& listPath, std::vector<std::string>& entries) {
    std::ifstream file(listPath);
    if (!file.is_open()) {
        Logger::error() << "Failed to open region list: " << listPath;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = stripLineTerminator(line);
        if (!line.empty()) {
            entries.push_back(line);
        }
    }
    return true;
}

size_t RegionIndex::discover(const std::string& worldRoot,
                             const std::vector<std::string>* explicitList) {
    if (explicitList != nullptr) {
        m_regions = buildFromList(worldRoot, *explicitList);
        Logger::info() << "Indexed " << m_regions.size() << " regions from a list of "
                       << explicitList->size() << " entries";
    } else {
        const std::string regionRoot = (fs::path(worldRoot) / "region").string();
        m_regions = buildFromPaths(selectCandidateFiles(listDirectories(regionRoot)));
        Logger::info() << "Discovered " << m_regions.size() << " regions under " << regionRoot;
    }
    return m_regions.size();
}

std::optional<std::string> RegionIndex::getRegionPath(int chunkX, int chunkY) const {
    const RegionFileRecord* record = getRecord(chunkToRegion(chunkX), chunkToRegion(chunkY));
    if (record == nullptr) {
        return std::nullopt;
    }
    return record->path;
}

const RegionFileRecord* RegionIndex::getRecord(int regionX, int regionY) const {
    auto it = m_regions.find(RegionKey{regionX, regionY});
    return it != m_regions.end() ? &it->second : nullptr;
}

std::vector<RegionKey> RegionIndex::getRegionKeys() const {
    std::vector<RegionKey> keys;
    keys.reserve(m_regions.size());
    for (const auto& entry : m_regions) {
        keys.push_back(entry.first);
    }
    return keys;
}
