#include "PageDecoder.h"

#include <algorithm>
#include <format>
#include <future>

#include <opencv2/imgproc.hpp>

#include "core/Errors.h"
#include "core/Logging/Logging.h"
#include "core/Page/BlockCodec.h"
#include "plugins/ImageCodec.h"

namespace ByteBlock {

nlohmann::json DecodeReport::toJson() const {
    nlohmann::json report = {
        {"image", {{"width", imageWidth}, {"height", imageHeight}}},
        {"header", {
            {"name", header.namePrefix},
            {"extension", header.extension},
            {"fileSize", header.fileSize},
            {"dataBlocks", header.blockCount},
            {"valid", headerValid}
        }},
        {"blocksRead", blocksRead}
    };
    if (!headerValid) {
        report["header"]["problem"] = headerProblem;
        return report;
    }
    report["footer"] = {
        {"nameSuffix", footer.nameSuffix},
        {"extension", footer.extension},
        {"checksum", footer.checksum}
    };
    report["computedChecksum"] = computedChecksum;
    report["checksumMatches"] = checksumMatches;
    return report;
}

PageDecoder::PageDecoder(const Geometry& geometry, unsigned int threads)
    : geometry_(geometry), layout_(geometry), threads_(std::max(1u, threads)) {
}

cv::Mat PageDecoder::toRgb8(const cv::Mat& image) const {
    if (image.empty()) {
        throw HeaderDecodeError("Image is empty");
    }

    cv::Mat rgb = image;
    if (rgb.depth() != CV_8U) {
        const double scale = rgb.depth() == CV_16U ? 1.0 / 257.0 : 1.0;
        rgb.convertTo(rgb, CV_MAKETYPE(CV_8U, rgb.channels()), scale);
    }

    switch (rgb.channels()) {
        case 3:
            break;
        case 1:
            cv::cvtColor(rgb, rgb, cv::COLOR_GRAY2RGB);
            break;
        case 4:
            cv::cvtColor(rgb, rgb, cv::COLOR_RGBA2RGB);
            break;
        default:
            throw HeaderDecodeError(std::format("Unsupported image with {} channels", rgb.channels()));
    }

    if (rgb.cols != geometry_.pageWidth() || rgb.rows != geometry_.pageHeight()) {
        Log(WARNING, "PageDecoder", "Image is {}x{}, expected {}x{}; blocks are read at their nominal positions",
            rgb.cols, rgb.rows, geometry_.pageWidth(), geometry_.pageHeight());
    }
    return rgb;
}

std::string PageDecoder::validateHeader(const HeaderFields& header) const {
    if (header.blockCount > layout_.dataCapacityBlocks()) {
        return std::format("Header declares {} data blocks, the page holds at most {}",
                           header.blockCount, layout_.dataCapacityBlocks());
    }
    const uint32_t expectedBlocks = (header.fileSize + kBlockBytes - 1) / kBlockBytes;
    if (header.blockCount != expectedBlocks) {
        return std::format("Header declares {} bytes in {} data blocks, expected {} blocks",
                           header.fileSize, header.blockCount, expectedBlocks);
    }
    if (header.namePrefix.empty() && header.extension.empty()) {
        return "Header carries no file name";
    }
    return {};
}

HeaderFields PageDecoder::readHeader(const cv::Mat& image) const {
    const cv::Point origin = layout_.placements(1).front();
    Log(DEBUG, "PageDecoder", "{} block at ({}, {})", blockKindName(BlockKind::Header), origin.x, origin.y);
    return parseHeader(sampleBlock(image, geometry_, origin));
}

std::vector<uint8_t> PageDecoder::sampleData(const cv::Mat& image, const std::vector<cv::Point>& positions,
                                             size_t first, size_t count) const {
    std::vector<uint8_t> data(count * kBlockBytes);
    if (count == 0) {
        return data;
    }

    // Each chunk owns its slice of the output, so no locking is needed
    auto sampleRange = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            const Block block = sampleBlock(image, geometry_, positions[first + i]);
            std::copy(block.begin(), block.end(), data.begin() + static_cast<std::ptrdiff_t>(i * kBlockBytes));
        }
    };

    const size_t chunks = std::min<size_t>(threads_, count);
    if (chunks <= 1) {
        sampleRange(0, count);
        return data;
    }

    const size_t chunkSize = (count + chunks - 1) / chunks;
    std::vector<std::future<void>> futures;
    futures.reserve(chunks);

    for (size_t c = 0; c < chunks; ++c) {
        size_t begin = c * chunkSize;
        if (begin >= count) break;
        size_t end = std::min(begin + chunkSize, count);
        futures.push_back(std::async(std::launch::async, sampleRange, begin, end));
    }

    for (auto& f : futures) {
        f.get();
    }

    Log(DEBUG, "PageDecoder", "Sampled {} data blocks in {} chunks", count, futures.size());
    return data;
}

std::vector<uint8_t> PageDecoder::readBody(const cv::Mat& image, const HeaderFields& header, Block& footerBlock) const {
    const std::vector<cv::Point> positions = layout_.placements(PageLayout::kFramingBlocks + header.blockCount);

    std::vector<uint8_t> data = sampleData(image, positions, 1, header.blockCount);
    data.resize(header.fileSize);

    const size_t footerSlot = positions.size() - 1;
    Log(DEBUG, "PageDecoder", "{} block at ({}, {})",
        blockKindName(PageLayout::blockKindAt(footerSlot, header.blockCount)), positions.back().x, positions.back().y);
    footerBlock = sampleBlock(image, geometry_, positions.back());
    return data;
}

DecodedPage PageDecoder::decode(const cv::Mat& input) const {
    const cv::Mat image = toRgb8(input);

    DecodedPage page;
    page.header = readHeader(image);
    const std::string problem = validateHeader(page.header);
    if (!problem.empty()) {
        throw HeaderDecodeError(problem);
    }

    Block footerBlock{};
    std::vector<uint8_t> data = readBody(image, page.header, footerBlock);

    if (!verifyFooter(footerBlock, data, page.header, &page.footer)) {
        throw IntegrityError(page.footer.checksum, checksum(data),
                             page.header.namePrefix, page.header.extension, page.header.fileSize);
    }

    page.file.baseName = page.header.namePrefix;
    page.file.extension = page.header.extension;
    page.file.data = std::move(data);

    Log(MESSAGE, "PageDecoder", "Decoded '{}': {} bytes from {} data blocks",
        page.file.fileName(), page.file.data.size(), page.header.blockCount);
    return page;
}

DecodeReport PageDecoder::inspect(const cv::Mat& input) const {
    const cv::Mat image = toRgb8(input);

    DecodeReport report;
    report.imageWidth = image.cols;
    report.imageHeight = image.rows;
    report.header = readHeader(image);
    report.blocksRead = 1;
    report.headerProblem = validateHeader(report.header);
    report.headerValid = report.headerProblem.empty();
    if (!report.headerValid) {
        Log(WARNING, "PageDecoder", "{}", report.headerProblem);
        return report;
    }

    Block footerBlock{};
    std::vector<uint8_t> data = readBody(image, report.header, footerBlock);
    report.blocksRead = PageLayout::kFramingBlocks + report.header.blockCount;
    report.computedChecksum = checksum(data);
    report.checksumMatches = verifyFooter(footerBlock, data, report.header, &report.footer);
    return report;
}

std::string PageDecoder::decodeFile(const std::string& imagePath, const std::string& outputDir) const {
    cv::Mat image = ImageCodecRegistry::getInstance().load(imagePath);
    DecodedPage page = decode(image);
    std::string written = FileStore::writeRawFile(page.file, outputDir);
    Log(MESSAGE, "PageDecoder", "Wrote {}", written);
    return written;
}

} // namespace ByteBlock
