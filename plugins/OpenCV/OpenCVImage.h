#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "plugins/ImageCodec.h"

namespace ByteBlock {

/**
 * @brief Every other raster format OpenCV's imgcodecs was built with
 *
 * Used for TIFF, BMP and the lossy formats. Only TIFF output carries the page
 * resolution; JPEG is written at quality 95, which still shifts colours enough to break
 * most pages.
 */
class OpenCVImage : public ImageCodec {
public:
    std::string getCodecName() const override { return "OpenCV"; }

    bool canRead(const std::string& path, const std::vector<uint8_t>& signature) const override;
    bool handlesExtension(const std::string& extension) const override;

    cv::Mat load(const std::string& path) const override;
    void save(const std::string& path, const cv::Mat& rgb, const ImageWriteOptions& options) const override;
};

} // namespace ByteBlock
