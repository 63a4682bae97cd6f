#include "PageCommands.h"

#include <iostream>

#include "PageDecoder.h"
#include "PageEncoder.h"
#include "core/CFG.h"
#include "plugins/ImageCodec.h"

namespace ByteBlock {

namespace {

EncodeOptions encodeOptionsFromConfig(const Geometry& geometry) {
    EncodeOptions options;
    options.imageFormat = BYTEBLOCK_CFG.ImageFormat;
    options.write.dpi = BYTEBLOCK_CFG.EmbedDpi ? geometry.dpi() : 0;
    options.write.compressionLevel = BYTEBLOCK_CFG.PngCompressionLevel;
    return options;
}

} // namespace

void registerPageCommands(CommandTable& commandTable) {
    commandTable["page"] = {
        "Byte block page operations",
        {
            {"encode", {
                "<input_file> <output_image_or_dir>",
                "Render a file as a page image (e.g., page encode notes.txt out/)",
                [](const std::vector<std::string>& args) -> int {
                    if (args.size() < 2) {
                        std::cerr << "Usage: page encode <input_file> <output_image_or_dir>" << std::endl;
                        return 1;
                    }
                    const Geometry geometry(PageSpec::standard());
                    PageEncoder encoder(geometry);
                    std::string written = encoder.encodeFile(args[0], args[1], encodeOptionsFromConfig(geometry));
                    std::cout << written << std::endl;
                    return 0;
                }
            }},
            {"decode", {
                "<image> <output_dir>",
                "Recover the file stored in a page image (e.g., page decode scan.png restored/)",
                [](const std::vector<std::string>& args) -> int {
                    if (args.size() < 2) {
                        std::cerr << "Usage: page decode <image> <output_dir>" << std::endl;
                        return 1;
                    }
                    const Geometry geometry(PageSpec::standard());
                    PageDecoder decoder(geometry, BYTEBLOCK_CFG.effectiveDecodeThreads());
                    std::string written = decoder.decodeFile(args[0], args[1]);
                    std::cout << written << std::endl;
                    return 0;
                }
            }},
            {"inspect", {
                "<image>",
                "Print the header, footer and checksum status of a page as JSON",
                [](const std::vector<std::string>& args) -> int {
                    if (args.empty()) {
                        std::cerr << "Usage: page inspect <image>" << std::endl;
                        return 1;
                    }
                    const Geometry geometry(PageSpec::standard());
                    PageDecoder decoder(geometry, BYTEBLOCK_CFG.effectiveDecodeThreads());
                    DecodeReport report = decoder.inspect(ImageCodecRegistry::getInstance().load(args[0]));
                    std::cout << report.toJson().dump(2) << std::endl;
                    return report.headerValid && report.checksumMatches ? 0 : 1;
                }
            }},
            {"capacity", {
                "",
                "Show the page geometry and how many bytes fit on one page",
                [](const std::vector<std::string>&) -> int {
                    const Geometry geometry(PageSpec::standard());
                    PageLayout layout(geometry);
                    std::cout << "Page:      " << geometry.pageWidth() << "x" << geometry.pageHeight()
                              << " px (" << geometry.spec().paperWidthMm << "x" << geometry.spec().paperHeightMm
                              << " mm) at " << geometry.dpi() << " DPI" << std::endl;
                    std::cout << "Block:     " << geometry.blockWidth() << "x" << geometry.blockHeight()
                              << " px, margin " << geometry.margin() << " px" << std::endl;
                    std::cout << "Grid:      " << layout.columns() << " x " << layout.rows()
                              << " = " << layout.capacity() << " blocks" << std::endl;
                    std::cout << "Capacity:  " << layout.dataCapacityBlocks() << " data blocks, "
                              << layout.dataCapacityBytes() << " bytes" << std::endl;
                    return 0;
                }
            }},
        }
    };
}

} // namespace ByteBlock
