#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "plugins/ImageCodec.h"

namespace ByteBlock {

/**
 * @brief Lossless page images through libpng
 *
 * Writes 8-bit RGB with the page resolution stored in a pHYs chunk. Reads any PNG
 * colour type and converts it to 8-bit RGB. A file cut short after its header still
 * loads: rows that were never read stay black.
 */
class PNG : public ImageCodec {
public:
    std::string getCodecName() const override { return "PNG"; }
    int getPriority() const override { return 10; }

    bool canRead(const std::string& path, const std::vector<uint8_t>& signature) const override;
    bool handlesExtension(const std::string& extension) const override { return extension == "png"; }

    cv::Mat load(const std::string& path) const override;
    void save(const std::string& path, const cv::Mat& rgb, const ImageWriteOptions& options) const override;

    // Pixels per metre for a pHYs chunk
    static uint32_t dpiToPixelsPerMeter(int dpi);
};

} // namespace ByteBlock
