#ifndef CFG_H
#define CFG_H

#pragma once

#include <string>

#include "Logging/Logging.h"

namespace ByteBlock {

class ConfigParser;

/**
 * @brief Runtime settings of the command line tool
 *
 * Page geometry is not part of it: encoder and decoder always use PageSpec::standard().
 */
class CFG {
    public:
    std::string configFilePath;

    bool Logging;
    LogLevel ConsoleLogLevel;
    std::string LogFile;
    int DecodeThreads;
    int PngCompressionLevel;
    bool EmbedDpi;
    std::string ImageFormat;

    CFG();

    void initialize(const std::string& configFile);
    void initializeFromParser(const ConfigParser& config);
    void setLogging(bool enabled) { Logging = enabled; }
    bool getLogging() const { return Logging; }

    // DecodeThreads with 0 resolved to the hardware concurrency
    unsigned int effectiveDecodeThreads() const;

    static std::string findConfigFile();

private:
    CFG(const CFG&) = delete;
    CFG& operator=(const CFG&) = delete;
};

// Global variable declaration always use this
extern CFG BYTEBLOCK_CFG;

} // namespace ByteBlock

#endif // CFG_H
