#include "PageEncoder.h"

#include <algorithm>
#include <filesystem>

#include "core/Errors.h"
#include "core/Logging/Logging.h"
#include "core/Page/BlockCodec.h"
#include "core/Page/Framing.h"

namespace fs = std::filesystem;

namespace ByteBlock {

PageEncoder::PageEncoder(const Geometry& geometry)
    : geometry_(geometry), layout_(geometry) {
}

cv::Mat PageEncoder::render(const RawFile& file) const {
    const size_t dataBlocks = (file.data.size() + kBlockBytes - 1) / kBlockBytes;
    const size_t totalBlocks = PageLayout::blocksForPayload(file.data.size());

    if (totalBlocks > layout_.capacity() || file.data.size() > kMaxFileSize) {
        throw PageOverflowError(totalBlocks, layout_.capacity());
    }

    Log(MESSAGE, "PageEncoder", "Encoding '{}': {} bytes in {} data blocks ({} of {} slots)",
        file.fileName(), file.data.size(), dataBlocks, totalBlocks, layout_.capacity());

    if (file.baseName.size() > kNameFieldBytes || file.extension.size() > kExtensionFieldBytes) {
        Log(WARNING, "PageEncoder", "Name '{}' is stored as '{}' + '{}' in the header",
            file.fileName(), file.baseName.substr(0, kNameFieldBytes), file.extension.substr(0, kExtensionFieldBytes));
    }

    cv::Mat canvas(geometry_.pageHeight(), geometry_.pageWidth(), CV_8UC3, cv::Scalar(255, 255, 255));
    BlockCursor cursor(geometry_);

    for (size_t slot = 0; slot < totalBlocks; ++slot) {
        const cv::Point origin = cursor.next();
        const BlockKind kind = PageLayout::blockKindAt(slot, dataBlocks);
        Block block{};
        switch (kind) {
            case BlockKind::Header:
                block = buildHeader(file.baseName, file.extension,
                                    static_cast<uint32_t>(file.data.size()), static_cast<uint32_t>(dataBlocks));
                break;
            case BlockKind::Data: {
                const size_t begin = (slot - 1) * kBlockBytes;
                const size_t count = std::min(kBlockBytes, file.data.size() - begin);
                std::copy_n(file.data.begin() + static_cast<std::ptrdiff_t>(begin), count, block.begin());
                break;
            }
            case BlockKind::Footer:
                block = buildFooter(file.baseName, file.extension, file.data);
                break;
        }
        drawBlock(canvas, geometry_, origin, block);
        if (kind != BlockKind::Data) {
            Log(DEBUG, "PageEncoder", "{} block at ({}, {})", blockKindName(kind), origin.x, origin.y);
        }
    }

    Log(DEBUG, "PageEncoder", "Drew {} blocks on a {}x{} page", cursor.emitted(), canvas.cols, canvas.rows);
    return canvas;
}

std::string PageEncoder::resolveOutputPath(const RawFile& file, const std::string& outputPath,
                                           const std::string& imageFormat) {
    std::error_code ec;
    const bool trailingSeparator = !outputPath.empty() && (outputPath.back() == '/' || outputPath.back() == '\\');
    if (trailingSeparator || fs::is_directory(outputPath, ec)) {
        std::string base = file.baseName.empty() ? file.fileName() : file.baseName;
        return (fs::path(outputPath) / (base + "_encoded." + imageFormat)).string();
    }
    if (!ImageCodecRegistry::getInstance().isWritableExtension(imageExtension(outputPath))) {
        return outputPath + "." + imageFormat;
    }
    return outputPath;
}

std::string PageEncoder::encodeFile(const std::string& inputPath, const std::string& outputPath,
                                    const EncodeOptions& options) const {
    RawFile file = FileStore::readRawFile(inputPath);
    const std::string target = resolveOutputPath(file, outputPath, options.imageFormat);

    // Nothing is written when the file does not fit
    cv::Mat page = render(file);

    fs::path parent = fs::path(target).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw IOError(parent.string(), "Cannot create directory (" + ec.message() + ")");
        }
    }

    ImageCodecRegistry::getInstance().save(target, page, options.write);
    Log(MESSAGE, "PageEncoder", "Saved page to {}", target);
    return target;
}

} // namespace ByteBlock
