#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/CFG.h"
#include "core/Errors.h"
#include "core/Logging/FileLogWriter.h"
#include "core/Logging/Logging.h"
#include "plugins/CommandRegistry.h"
#include "services/PageService/PageCommands.h"

using namespace ByteBlock;

int main(int argc, char **argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string configFile = extractConfigOption(args);

    // Auto-detect config file if not specified
    if (configFile.empty()) {
        configFile = CFG::findConfigFile();
    }

    // Initialize command registry for help or execution
    CommandTable commandTable;
    registerPageCommands(commandTable);

    // Show help if no command specified
    if (args.empty()) {
        printHelp(commandTable, argv[0]);
        return 0;
    }

    InitializeLogging(WARNING);
    // Initialize ByteBlock CFG
    BYTEBLOCK_CFG.initialize(configFile);
    ToggleLogging(BYTEBLOCK_CFG.Logging);
    SetConsoleWindowLogLevel(BYTEBLOCK_CFG.ConsoleLogLevel);
    if (BYTEBLOCK_CFG.Logging && !BYTEBLOCK_CFG.LogFile.empty()) {
        AddLogWriter(std::make_shared<FileLogWriter>(BYTEBLOCK_CFG.LogFile, DEBUG));
    }

    int result = 1;
    try {
        result = prepareCommands(commandTable, args);
    } catch (const ByteBlockError& e) {
        Log(ERROR, "Core", "{} failed ({}): {}", args[0] + " " + (args.size() > 1 ? args[1] : ""),
            errorKindName(e.kind()), e.what());
        result = 1;
    } catch (const std::exception& e) {
        Log(FATAL, "Core", "Unexpected error: {}", e.what());
        result = 1;
    }

    // Shutdown our logging system
    ShutdownLogging();
    return result;
}
