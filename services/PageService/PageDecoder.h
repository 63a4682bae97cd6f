#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include "FileStore.h"
#include "core/Page/Framing.h"
#include "core/Page/Geometry.h"
#include "core/Page/PageLayout.h"

namespace ByteBlock {

struct DecodedPage {
    RawFile file;
    HeaderFields header;
    FooterFields footer;
};

// What a page contains, gathered without failing on a bad header or checksum
struct DecodeReport {
    int imageWidth = 0;
    int imageHeight = 0;
    HeaderFields header;
    bool headerValid = false;
    std::string headerProblem;
    size_t blocksRead = 0;
    FooterFields footer;
    uint64_t computedChecksum = 0;
    bool checksumMatches = false;

    nlohmann::json toJson() const;
};

/**
 * @brief Recovers a file from a page image
 *
 * Block positions are replayed with the same traversal the encoder used, so the image
 * must have been rendered with an identical Geometry. Data blocks are sampled in
 * contiguous chunks on up to `threads` workers; the result does not depend on the
 * thread count.
 */
class PageDecoder {
public:
    explicit PageDecoder(const Geometry& geometry, unsigned int threads = 1);

    /**
     * @brief Decode and verify a page
     * @param image RGB page; grey, RGBA and 16-bit images are converted first
     * @throws HeaderDecodeError when the header does not describe a page of this geometry
     * @throws IntegrityError when the footer checksum does not match the recovered bytes
     */
    DecodedPage decode(const cv::Mat& image) const;

    DecodeReport inspect(const cv::Mat& image) const;

    /**
     * @brief Load an image, decode it and write the file into outputDir
     * @return Path of the written file; nothing is written when decoding fails
     */
    std::string decodeFile(const std::string& imagePath, const std::string& outputDir) const;

private:
    Geometry geometry_;
    PageLayout layout_;
    unsigned int threads_;

    // Empty when the header is consistent with the page, otherwise the reason
    std::string validateHeader(const HeaderFields& header) const;

    HeaderFields readHeader(const cv::Mat& image) const;

    // Data bytes of a validated header, trimmed to the file size; footerBlock receives the Footer
    std::vector<uint8_t> readBody(const cv::Mat& image, const HeaderFields& header, Block& footerBlock) const;

    std::vector<uint8_t> sampleData(const cv::Mat& image, const std::vector<cv::Point>& positions,
                                    size_t first, size_t count) const;

    cv::Mat toRgb8(const cv::Mat& image) const;
};

} // namespace ByteBlock
