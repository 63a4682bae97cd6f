#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "FileStore.h"
#include "core/Page/Geometry.h"
#include "core/Page/PageLayout.h"
#include "plugins/ImageCodec.h"

namespace ByteBlock {

struct EncodeOptions {
    std::string imageFormat = "png"; // extension used when the output path does not name one
    ImageWriteOptions write;
};

/**
 * @brief Renders one file as a single page of byte blocks
 *
 * Block order on the page is Header, Data blocks, Footer. The last Data block is zero
 * padded; the Header records the real file size so the padding is trimmed on decode.
 */
class PageEncoder {
public:
    explicit PageEncoder(const Geometry& geometry);

    /**
     * @brief Draw the page for a file
     * @return White CV_8UC3 RGB canvas of the full page size
     * @throws PageOverflowError when the file does not fit, before anything is drawn
     */
    cv::Mat render(const RawFile& file) const;

    /**
     * @brief Read inputPath, render it and save the image
     *
     * A directory output receives "<base>_encoded.<imageFormat>"; an output without a
     * writable image extension gets ".<imageFormat>" appended.
     * @return Path of the written image
     */
    std::string encodeFile(const std::string& inputPath, const std::string& outputPath,
                           const EncodeOptions& options) const;

    static std::string resolveOutputPath(const RawFile& file, const std::string& outputPath,
                                         const std::string& imageFormat);

private:
    Geometry geometry_;
    PageLayout layout_;
};

} // namespace ByteBlock
