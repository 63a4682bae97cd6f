#pragma once

#include <map>
#include <string>

namespace ByteBlock {

/**
 * @brief Flat key=value reader for .cfg files
 *
 * Blank lines and lines starting with '#' or ';' are ignored; values may be quoted.
 */
class ConfigParser {
private:
    std::map<std::string, std::string> configValues;

public:
    ConfigParser() = default;

    // Returns false when the file cannot be opened; malformed lines are skipped with a warning
    bool loadFromFile(const std::string& filename);

    // Parse configuration text directly (used for files and tests alike)
    void loadFromString(const std::string& text, const std::string& sourceName = "<string>");

    std::string get(const std::string& key, const std::string& defaultValue = "") const;
    int getInt(const std::string& key, int defaultValue) const;
    bool getBool(const std::string& key, bool defaultValue) const;

    bool hasKey(const std::string& key) const;

    const std::map<std::string, std::string>& getAllValues() const { return configValues; }

private:
    bool parseLine(const std::string& line);
    std::string trim(const std::string& str) const;
};

} // namespace ByteBlock
