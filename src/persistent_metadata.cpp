/**
 * @file persistent_metadata.cpp
 * @brief YAML persistence of points of interest
 */

#include "persistent_metadata.h"
#include "logger.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

std::string PersistentMetadataStore::toYaml(const PersistentState& state) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "version" << YAML::Value << FORMAT_VERSION;

    out << YAML::Key << "poi" << YAML::Value << YAML::BeginSeq;
    for (const auto& poi : state.pointsOfInterest) {
        out << YAML::BeginMap;
        out << YAML::Key << "x" << YAML::Value << poi.x;
        out << YAML::Key << "y" << YAML::Value << poi.y;
        out << YAML::Key << "z" << YAML::Value << poi.z;
        out << YAML::Key << "msg" << YAML::Value << poi.message;
        out << YAML::Key << "type" << YAML::Value << poi.kind;
        if (!poi.extra.empty()) {
            out << YAML::Key << "extra" << YAML::Value << YAML::BeginMap;
            for (const auto& field : poi.extra) {
                out << YAML::Key << field.first << YAML::Value << field.second;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "extensions" << YAML::Value << YAML::BeginMap;
    for (const auto& entry : state.extensions) {
        out << YAML::Key << entry.first << YAML::Value << entry.second;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}

bool PersistentMetadataStore::fromNode(const YAML::Node& root, PersistentState& state) {
    // Parsed into a local so that a failure part-way leaves state empty
    state = PersistentState();
    PersistentState parsed;

    if (!root.IsMap()) {
        Logger::error() << "Metadata root must be a map";
        return false;
    }

    if (!root["version"]) {
        Logger::error() << "Metadata missing 'version' field";
        return false;
    }
    int version = root["version"].as<int>();
    if (version != FORMAT_VERSION) {
        Logger::error() << "Unsupported metadata version: " << version;
        return false;
    }

    const YAML::Node poiNode = root["poi"];
    if (poiNode) {
        if (!poiNode.IsSequence()) {
            Logger::error() << "'poi' field must be a sequence";
            return false;
        }
        for (size_t i = 0; i < poiNode.size(); ++i) {
            const YAML::Node entry = poiNode[i];
            if (!entry["x"] || !entry["y"] || !entry["z"]) {
                Logger::error() << "Point of interest " << i << " is missing a coordinate";
                return false;
            }

            PointOfInterest poi;
            poi.x = entry["x"].as<int>();
            poi.y = entry["y"].as<int>();
            poi.z = entry["z"].as<int>();
            poi.message = entry["msg"].as<std::string>("");
            poi.kind = entry["type"].as<std::string>("");

            const YAML::Node extra = entry["extra"];
            if (extra && extra.IsMap()) {
                for (auto it = extra.begin(); it != extra.end(); ++it) {
                    poi.extra[it->first.as<std::string>()] = YAML::Clone(it->second);
                }
            }

            parsed.pointsOfInterest.push_back(std::move(poi));
        }
    }

    const YAML::Node extensions = root["extensions"];
    if (extensions && extensions.IsMap()) {
        for (auto it = extensions.begin(); it != extensions.end(); ++it) {
            parsed.extensions[it->first.as<std::string>()] = YAML::Clone(it->second);
        }
    }

    state = std::move(parsed);
    return true;
}

bool PersistentMetadataStore::fromYaml(const std::string& text, PersistentState& state) {
    try {
        return fromNode(YAML::Load(text), state);
    } catch (const YAML::Exception& e) {
        Logger::error() << "YAML error while parsing metadata: " << e.what();
        state = PersistentState();
        return false;
    }
}

bool PersistentMetadataStore::load(const std::string& path, PersistentState& state) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        Logger::info() << "No metadata file at " << path << ", starting with defaults";
        state = PersistentState();
        return true;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);
        if (!fromNode(root, state)) {
            Logger::error() << "Failed to load metadata file: " << path;
            return false;
        }
    } catch (const YAML::Exception& e) {
        Logger::error() << "YAML error while loading " << path << ": " << e.what();
        state = PersistentState();
        return false;
    }

    Logger::info() << "Loaded " << state.pointsOfInterest.size() << " points of interest from " << path;
    return true;
}

bool PersistentMetadataStore::save(const std::string& path, const PersistentState& state) {
    try {
        fs::path filePath(path);
        if (filePath.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(filePath.parent_path(), ec);
            if (ec) {
                Logger::error() << "Failed to create directory: " << filePath.parent_path() << " - " << ec.message();
                return false;
            }
        }

        const std::string text = toYaml(state);

        std::ofstream fout(path, std::ios::trunc);
        if (!fout.is_open()) {
            Logger::error() << "Failed to open file for writing: " << path;
            return false;
        }

        fout << text << "\n";
        fout.close();
        if (fout.fail()) {
            Logger::error() << "Failed to write metadata file: " << path;
            return false;
        }

        Logger::info() << "Saved " << state.pointsOfInterest.size() << " points of interest to " << path;
        return true;

    } catch (const YAML::Exception& e) {
        Logger::error() << "YAML error while saving metadata: " << e.what();
        return false;
    }
}
