#include "ConsoleLogWriter.h"
#include <cstdlib>
#include <unistd.h>

namespace ByteBlock {

namespace Colors {
    const char* RESET = "\033[0m";
    const char* CYAN = "\033[36m";
    const char* WHITE = "\033[37m";
    const char* GREEN = "\033[32m";
    const char* BLUE = "\033[34m";
    const char* YELLOW = "\033[33m";
    const char* RED = "\033[31m";
    const char* DIM = "\033[2m";
    const char* BOLD_RED = "\033[1;31m";
}

ConsoleLogWriter::ConsoleLogWriter(LogLevel level, std::ostream& stream)
    : LogWriter(level), output(stream), colorsEnabled(&stream == &std::cerr && supportsColors())
{
}

void ConsoleLogWriter::WriteLogMessage(const LogMessage& msg) {
    if (colorsEnabled) {
        output << getLevelColor(msg.level) << "[" << LogLevelName(msg.level) << "]" << Colors::RESET
               << Colors::CYAN << "[" << msg.owner << "]" << Colors::RESET
               << " " << msg.message << std::endl;
    } else {
        output << "[" << LogLevelName(msg.level) << "]["
               << msg.owner << "] "
               << msg.message << std::endl;
    }
}

void ConsoleLogWriter::Flush() {
    output.flush();
}

const char* ConsoleLogWriter::getLevelColor(LogLevel level) const {
    switch (level) {
        case INTERNAL: return Colors::DIM;
        case FATAL: return Colors::BOLD_RED;
        case ERROR: return Colors::RED;
        case WARNING: return Colors::YELLOW;
        case MESSAGE: return Colors::GREEN;
        case DEBUG: return Colors::BLUE;
        default: return Colors::WHITE;
    }
}

bool ConsoleLogWriter::supportsColors() const {
    // Redirected output stays free of escape codes
    if (!isatty(STDERR_FILENO)) {
        return false;
    }
    if (std::getenv("NO_COLOR")) {
        return false;
    }
    const char* term = std::getenv("TERM");
    if (!term) return false;

    std::string terminal(term);
    return terminal != "dumb" &&
           (terminal.find("xterm") != std::string::npos ||
            terminal.find("linux") != std::string::npos ||
            terminal.find("screen") != std::string::npos ||
            terminal.find("tmux") != std::string::npos ||
            terminal.find("color") != std::string::npos);
}

} // namespace ByteBlock
