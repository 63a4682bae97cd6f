#include "OpenCVImage.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "core/Errors.h"
#include "core/Logging/Logging.h"

namespace ByteBlock {

bool OpenCVImage::canRead(const std::string& path, const std::vector<uint8_t>& signature) const {
    if (signature.empty()) {
        return false;
    }
    try {
        return cv::haveImageReader(path);
    } catch (const cv::Exception& e) {
        Log(DEBUG, "OpenCV", "haveImageReader failed for {}: {}", path, e.what());
        return false;
    }
}

bool OpenCVImage::handlesExtension(const std::string& extension) const {
    if (extension.empty()) {
        return false;
    }
    try {
        return cv::haveImageWriter("page." + extension);
    } catch (const cv::Exception&) {
        return false;
    }
}

cv::Mat OpenCVImage::load(const std::string& path) const {
    cv::Mat bgr;
    try {
        bgr = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw IOError(path, std::string("Cannot decode image (") + e.what() + ")");
    }
    if (bgr.empty()) {
        throw IOError(path, "Cannot decode image");
    }

    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return rgb;
}

void OpenCVImage::save(const std::string& path, const cv::Mat& rgb, const ImageWriteOptions& options) const {
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw IOError(path, "Expected a non-empty 8-bit RGB image");
    }

    const std::string extension = imageExtension(path);
    std::vector<int> params;
    if ((extension == "tif" || extension == "tiff") && options.dpi > 0) {
        params = {cv::IMWRITE_TIFF_RESUNIT, 2, // inches
                  cv::IMWRITE_TIFF_XDPI, options.dpi,
                  cv::IMWRITE_TIFF_YDPI, options.dpi};
    } else if (extension == "jpg" || extension == "jpeg") {
        params = {cv::IMWRITE_JPEG_QUALITY, 95};
        Log(WARNING, "OpenCV", "{}: JPEG is lossy, the page will probably not decode", path);
    } else if (options.dpi > 0) {
        Log(DEBUG, "OpenCV", "{}: resolution is not stored for .{} files", path, extension);
    }

    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);

    bool written = false;
    try {
        written = cv::imwrite(path, bgr, params);
    } catch (const cv::Exception& e) {
        throw IOError(path, std::string("Cannot encode image (") + e.what() + ")");
    }
    if (!written) {
        throw IOError(path, "Cannot encode image");
    }
}

REGISTER_IMAGE_CODEC(OpenCVImage)

} // namespace ByteBlock
