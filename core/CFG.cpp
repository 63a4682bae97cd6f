#include "CFG.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

#include "ConfigParser.h"

namespace ByteBlock {

CFG::CFG()
    : Logging(true), ConsoleLogLevel(MESSAGE), LogFile("byteblock.log"),
      DecodeThreads(0), PngCompressionLevel(6), EmbedDpi(true), ImageFormat("png") {}

void CFG::initialize(const std::string& configFile) {
    configFilePath = configFile;
    ConfigParser config;

    if (configFile.empty()) {
        Log(MESSAGE, "Config", "No config file, using defaults");
    } else if (!config.loadFromFile(configFile)) {
        Log(WARNING, "Config", "Could not load config file: {}, using defaults", configFile);
    }

    initializeFromParser(config);
}

void CFG::initializeFromParser(const ConfigParser& config) {
    Logging = config.getBool("Logging", true);
    ConsoleLogLevel = ParseLogLevel(config.get("ConsoleLogLevel", "MESSAGE"), MESSAGE);
    LogFile = config.get("LogFile", "byteblock.log");

    DecodeThreads = config.getInt("DecodeThreads", 0);
    if (DecodeThreads < 0) {
        Log(WARNING, "Config", "Negative DecodeThreads {}, using hardware concurrency", DecodeThreads);
        DecodeThreads = 0;
    }

    PngCompressionLevel = config.getInt("PngCompressionLevel", 6);
    if (PngCompressionLevel < 0 || PngCompressionLevel > 9) {
        Log(WARNING, "Config", "PngCompressionLevel {} outside 0-9, using 6", PngCompressionLevel);
        PngCompressionLevel = 6;
    }

    EmbedDpi = config.getBool("EmbedDpi", true);

    ImageFormat = config.get("ImageFormat", "png");
    if (!ImageFormat.empty() && ImageFormat[0] == '.') {
        ImageFormat.erase(0, 1);
    }
    std::transform(ImageFormat.begin(), ImageFormat.end(), ImageFormat.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ImageFormat.empty()) {
        ImageFormat = "png";
    }

    Log(DEBUG, "Config", "Logging={} ConsoleLogLevel={} LogFile={} DecodeThreads={} PngCompressionLevel={} EmbedDpi={} ImageFormat={}",
        Logging, LogLevelName(ConsoleLogLevel), LogFile, DecodeThreads, PngCompressionLevel, EmbedDpi, ImageFormat);
}

unsigned int CFG::effectiveDecodeThreads() const {
    if (DecodeThreads > 0) {
        return static_cast<unsigned int>(DecodeThreads);
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

// Helper function to auto-detect config file
std::string CFG::findConfigFile() {
    try {
        std::vector<std::string> configFiles;
        for (const auto &entry : std::filesystem::directory_iterator(".")) {
            if (entry.is_regular_file() && entry.path().extension() == ".cfg") {
                configFiles.push_back(entry.path().string());
            }
        }
        if (!configFiles.empty()) {
            std::sort(configFiles.begin(), configFiles.end());
            return configFiles[0];
        }
    } catch (const std::filesystem::filesystem_error &e) {
        std::cerr << "Error scanning for config files: " << e.what() << std::endl;
    }
    return "";
}

// Define the global variable
CFG BYTEBLOCK_CFG;

} // namespace ByteBlock
