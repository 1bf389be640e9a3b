/**
 * @file persistent_metadata.h
 * @brief Points of interest and the side-car file that keeps them between runs
 *
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

/**
 * @brief A labeled world position shown as a map marker
 *
 * extra holds free-form fields (e.g. the spawn's in-chunk position) and is
 * written to disk as-is.
 */
struct PointOfInterest {
    int x = 0;
    int y = 0;
    int z = 0;
    std::string message;
    std::string kind;
    std::map<std::string, YAML::Node> extra;
};

/**
 * @brief Contents of the side-car file
 *
 * Marker order is display order. extensions carries any other data callers
 * want to keep across runs, keyed by name.
 */
struct PersistentState {
    std::vector<PointOfInterest> pointsOfInterest;
    std::map<std::string, YAML::Node> extensions;
};

/**
 * @brief Loads and saves PersistentState as YAML
 *
 * File format:
 * ```yaml
 * version: 1
 * poi:
 *   - x: 12
 *     y: 70
 *     z: -40
 *     msg: Spawn
 *     type: spawn
 *     extra:
 *       chunk: [12, 8]
 * extensions:
 *   last_render: 1296000000
 * ```
 *
 * Nothing saves automatically: after changing markers the owner must call
 * save() or the changes are lost when the process exits.
 */
class PersistentMetadataStore {
public:
    static constexpr int FORMAT_VERSION = 1;

    /**
     * @brief Reads the side-car file
     *
     * A missing file is not an error: state is reset to empty and true is
     * returned.
     *
     * @param path Side-car file path
     * @param state Receives the file contents
     * @return False if the file exists but cannot be parsed (state is reset)
     */
    static bool load(const std::string& path, PersistentState& state);

    /**
     * @brief Writes the side-car file, replacing any previous contents
     * @return True if the file was written completely
     */
    static bool save(const std::string& path, const PersistentState& state);

    /**
     * @brief Serializes a state to YAML text
     */
    static std::string toYaml(const PersistentState& state);

    /**
     * @brief Parses YAML text produced by toYaml()
     * @return False on malformed input or an unsupported version
     */
    static bool fromYaml(const std::string& text, PersistentState& state);

private:
    static bool fromNode(const YAML::Node& root, PersistentState& state);
};
