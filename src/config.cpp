#include "config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

bool Config::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        Logger::error() << "Failed to open config file: " << filepath;
        return false;
    }

    parse(file);
    return true;
}

bool Config::loadFromString(const std::string& text) {
    std::istringstream in(text);
    parse(in);
    return true;
}

void Config::parse(std::istream& in) {
    std::string currentSection;
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line[line.length() - 1] == ']') {
            currentSection = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos) {
            Logger::warning() << "Ignoring config line without '=': " << line;
            continue;
        }

        std::string key = trim(line.substr(0, equalPos));
        std::string value = trim(line.substr(equalPos + 1));

        // Inline comments
        size_t commentPos = value.find_first_of("#;");
        if (commentPos != std::string::npos) {
            value = trim(value.substr(0, commentPos));
        }

        if (!currentSection.empty() && !key.empty()) {
            m_data[currentSection][key] = value;
        }
    }
}

const std::string* Config::find(const std::string& section, const std::string& key) const {
    auto sectionIt = m_data.find(section);
    if (sectionIt == m_data.end()) {
        return nullptr;
    }
    auto keyIt = sectionIt->second.find(key);
    if (keyIt == sectionIt->second.end()) {
        return nullptr;
    }
    return &keyIt->second;
}

bool Config::hasKey(const std::string& section, const std::string& key) const {
    return find(section, key) != nullptr;
}

bool Config::getBool(const std::string& section, const std::string& key, bool defaultValue) const {
    const std::string* value = find(section, key);
    if (!value) {
        return defaultValue;
    }

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }

    Logger::warning() << "Failed to parse bool for [" << section << "]:" << key;
    return defaultValue;
}

std::string Config::getString(const std::string& section, const std::string& key, const std::string& defaultValue) const {
    const std::string* value = find(section, key);
    return value ? *value : defaultValue;
}

std::string Config::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool Config::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        Logger::error() << "Failed to open config file for writing: " << filepath;
        return false;
    }

    for (const auto& section : m_data) {
        file << "[" << section.first << "]\n";
        for (const auto& keyValue : section.second) {
            file << keyValue.first << " = " << keyValue.second << "\n";
        }
        file << "\n";
    }

    if (!file.good()) {
        Logger::error() << "Failed to write config file: " << filepath;
        return false;
    }
    return true;
}

void Config::setBool(const std::string& section, const std::string& key, bool value) {
    m_data[section][key] = value ? "true" : "false";
}

void Config::setString(const std::string& section, const std::string& key, const std::string& value) {
    m_data[section][key] = value;
}
