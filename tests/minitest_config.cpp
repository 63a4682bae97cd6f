// ConfigParser and CFG defaults, parsing and clamping

#include <iostream>

#include "core/CFG.h"
#include "core/ConfigParser.h"
#include "minitest.h"

using namespace ByteBlock;

static bool test_parser_syntax() {
    ConfigParser parser;
    parser.loadFromString(
        "# comment\n"
        "; another comment\n"
        "\n"
        "  Key = value with spaces  \n"
        "Quoted=\"a b\"\n"
        "Single='c'\n"
        "no equals sign\n"
        "=orphan\n"
        "Number=42\n"
        "BadNumber=4x\n"
        "Flag=yes\n"
        "BadFlag=maybe\n");

    T_ASSERT(parser.get("Key") == "value with spaces");
    T_ASSERT(parser.get("Quoted") == "a b");
    T_ASSERT(parser.get("Single") == "c");
    T_ASSERT(parser.get("Missing", "fallback") == "fallback");
    T_ASSERT(!parser.hasKey(""));
    T_ASSERT(parser.getInt("Number", 0) == 42);
    T_ASSERT(parser.getInt("BadNumber", 7) == 7);
    T_ASSERT(parser.getInt("Missing", 9) == 9);
    T_ASSERT(parser.getBool("Flag", false));
    T_ASSERT(parser.getBool("BadFlag", true));
    T_ASSERT(!parser.getBool("BadFlag", false));
    T_ASSERT(parser.getAllValues().size() == 7);
    return true;
}

static bool test_defaults() {
    CFG cfg;
    cfg.initialize("");
    T_ASSERT(cfg.Logging);
    T_ASSERT(cfg.ConsoleLogLevel == MESSAGE);
    T_ASSERT(cfg.LogFile == "byteblock.log");
    T_ASSERT(cfg.DecodeThreads == 0);
    T_ASSERT(cfg.effectiveDecodeThreads() >= 1);
    T_ASSERT(cfg.PngCompressionLevel == 6);
    T_ASSERT(cfg.EmbedDpi);
    T_ASSERT(cfg.ImageFormat == "png");

    // A missing file falls back to the same defaults
    CFG missing;
    missing.initialize("/nonexistent/byteblock.cfg");
    T_ASSERT(missing.ImageFormat == "png" && missing.PngCompressionLevel == 6);
    return true;
}

static bool test_values_and_clamping() {
    ConfigParser parser;
    parser.loadFromString(
        "Logging=off\n"
        "ConsoleLogLevel=debug\n"
        "LogFile=\n"
        "DecodeThreads=3\n"
        "PngCompressionLevel=9\n"
        "EmbedDpi=0\n"
        "ImageFormat=.TIFF\n");
    CFG cfg;
    cfg.initializeFromParser(parser);
    T_ASSERT(!cfg.Logging);
    T_ASSERT(cfg.ConsoleLogLevel == DEBUG);
    T_ASSERT(cfg.LogFile.empty());
    T_ASSERT(cfg.effectiveDecodeThreads() == 3);
    T_ASSERT(cfg.PngCompressionLevel == 9);
    T_ASSERT(!cfg.EmbedDpi);
    T_ASSERT(cfg.ImageFormat == "tiff");

    ConfigParser bad;
    bad.loadFromString(
        "ConsoleLogLevel=LOUD\n"
        "DecodeThreads=-2\n"
        "PngCompressionLevel=12\n"
        "ImageFormat=\n");
    CFG clamped;
    clamped.initializeFromParser(bad);
    T_ASSERT(clamped.ConsoleLogLevel == MESSAGE);
    T_ASSERT(clamped.DecodeThreads == 0);
    T_ASSERT(clamped.PngCompressionLevel == 6);
    T_ASSERT(clamped.ImageFormat == "png");
    return true;
}

static bool test_log_level_names() {
    T_ASSERT(ParseLogLevel("warning", MESSAGE) == WARNING);
    T_ASSERT(ParseLogLevel("ERROR", MESSAGE) == ERROR);
    T_ASSERT(ParseLogLevel("nonsense", FATAL) == FATAL);
    T_ASSERT(std::string(LogLevelName(DEBUG)) == "DEBUG");
    return true;
}

int main() {
    bool ok = true;
    T_RUN(ok, test_parser_syntax);
    T_RUN(ok, test_defaults);
    T_RUN(ok, test_values_and_clamping);
    T_RUN(ok, test_log_level_names);
    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
