#pragma once
#include <istream>
#include <string>
#include <map>

/**
 * @brief INI-style settings store ([Section] key = value)
 *
 * Lines starting with '#' or ';' are comments, as are trailing '#'/';' parts
 * of a value. Keys outside any section are ignored.
 */
class Config {
public:
    Config() = default;

    bool loadFromFile(const std::string& filepath);
    bool loadFromString(const std::string& text);
    bool saveToFile(const std::string& filepath) const;

    bool hasKey(const std::string& section, const std::string& key) const;

    bool getBool(const std::string& section, const std::string& key, bool defaultValue = false) const;
    std::string getString(const std::string& section, const std::string& key, const std::string& defaultValue = "") const;

    void setBool(const std::string& section, const std::string& key, bool value);
    void setString(const std::string& section, const std::string& key, const std::string& value);

private:
    void parse(std::istream& in);
    const std::string* find(const std::string& section, const std::string& key) const;

    std::map<std::string, std::map<std::string, std::string>> m_data;

    static std::string trim(const std::string& str);
};
