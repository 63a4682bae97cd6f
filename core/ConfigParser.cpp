#include "ConfigParser.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "Logging/Logging.h"

namespace ByteBlock {

bool ConfigParser::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream contents;
    contents << file.rdbuf();
    loadFromString(contents.str(), filename);
    return true;
}

void ConfigParser::loadFromString(const std::string& text, const std::string& sourceName) {
    std::istringstream stream(text);
    std::string line;
    int lineNumber = 0;

    while (std::getline(stream, line)) {
        lineNumber++;
        if (!parseLine(line)) {
            Log(WARNING, "Config", "{}:{}: ignoring malformed line '{}'", sourceName, lineNumber, trim(line));
        }
    }
}

std::string ConfigParser::get(const std::string& key, const std::string& defaultValue) const {
    auto it = configValues.find(key);
    if (it != configValues.end()) {
        return it->second;
    }
    return defaultValue;
}

int ConfigParser::getInt(const std::string& key, int defaultValue) const {
    auto it = configValues.find(key);
    if (it == configValues.end() || it->second.empty()) {
        return defaultValue;
    }
    try {
        size_t consumed = 0;
        int value = std::stoi(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        Log(WARNING, "Config", "Invalid integer '{}' for {}, using {}", it->second, key, defaultValue);
        return defaultValue;
    }
}

bool ConfigParser::getBool(const std::string& key, bool defaultValue) const {
    auto it = configValues.find(key);
    if (it == configValues.end() || it->second.empty()) {
        return defaultValue;
    }
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    Log(WARNING, "Config", "Invalid boolean '{}' for {}, using {}", it->second, key, defaultValue);
    return defaultValue;
}

bool ConfigParser::hasKey(const std::string& key) const {
    return configValues.find(key) != configValues.end();
}

bool ConfigParser::parseLine(const std::string& line) {
    std::string trimmedLine = trim(line);

    if (trimmedLine.empty() || trimmedLine[0] == '#' || trimmedLine[0] == ';') {
        return true;
    }

    size_t equalsPos = trimmedLine.find('=');
    if (equalsPos == std::string::npos) {
        return false;
    }

    std::string key = trim(trimmedLine.substr(0, equalsPos));
    std::string value = trim(trimmedLine.substr(equalsPos + 1));

    if (value.length() >= 2 &&
        ((value[0] == '"' && value[value.length()-1] == '"') ||
         (value[0] == '\'' && value[value.length()-1] == '\''))) {
        value = value.substr(1, value.length() - 2);
    }

    if (key.empty()) {
        return false;
    }
    configValues[key] = value;
    return true;
}

std::string ConfigParser::trim(const std::string& str) const {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }

    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

} // namespace ByteBlock
