#include "Logging.h"
#include "Logger.h"
#include "FileLogWriter.h"
#include "ConsoleLogWriter.h"

#include <algorithm>
#include <cctype>
#include <memory>

namespace ByteBlock {

static std::unique_ptr<Logger> globalLogger;
static std::shared_ptr<ConsoleLogWriter> consoleWriter;
static std::atomic<bool> loggingEnabled{true};

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case INTERNAL: return "INTERNAL";
        case FATAL: return "FATAL";
        case ERROR: return "ERROR";
        case WARNING: return "WARNING";
        case MESSAGE: return "MESSAGE";
        case DEBUG: return "DEBUG";
        default: return "UNKNOWN";
    }
}

LogLevel ParseLogLevel(const std::string& text, LogLevel fallback) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (LogLevel level : {FATAL, ERROR, WARNING, MESSAGE, DEBUG}) {
        if (upper == LogLevelName(level) || upper == std::to_string(static_cast<int>(level))) {
            return level;
        }
    }
    return fallback;
}

void ToggleLogging(bool enabled) {
    loggingEnabled = enabled;
}

void AddLogWriter(std::shared_ptr<LogWriter> writer) {
    if (globalLogger) {
        globalLogger->AddLogWriter(std::move(writer));
    }
}

void SetConsoleWindowLogLevel(LogLevel level) {
    if (consoleWriter) {
        consoleWriter->level = level;
    }
}

void LogMsg(LogLevel level, const char* owner, const char* message) {
    if (!loggingEnabled || !globalLogger) {
        return;
    }

    globalLogger->LogMsg(level, owner, message);
}

void FlushLogs() {
    if (globalLogger) {
        globalLogger->Flush();
    }
}

void InitializeLogging(LogLevel consoleLevel, const std::string& logFilePath) {
    if (globalLogger) {
        return; // Already initialized
    }

    std::deque<Logger::WriterPtr> writers;
    consoleWriter = std::make_shared<ConsoleLogWriter>(consoleLevel);
    writers.push_back(consoleWriter);

    if (!logFilePath.empty()) {
        // The file always records everything down to DEBUG
        writers.push_back(std::make_shared<FileLogWriter>(logFilePath, DEBUG));
    }

    globalLogger = std::make_unique<Logger>(std::move(writers));
}

void ShutdownLogging() {
    if (globalLogger) {
        FlushLogs();
        globalLogger.reset();
        consoleWriter.reset();
    }
}

} // namespace ByteBlock
