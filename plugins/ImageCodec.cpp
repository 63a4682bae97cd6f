#include "ImageCodec.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include "core/Errors.h"

namespace ByteBlock {

std::string imageExtension(const std::string& path) {
    std::string extension = std::filesystem::path(path).extension().string();
    if (!extension.empty() && extension[0] == '.') {
        extension.erase(0, 1);
    }
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

void ImageCodecRegistry::registerCodec(const std::string& name, CodecFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    codecs_.push_back(factory());
    std::stable_sort(codecs_.begin(), codecs_.end(),
                     [](const std::unique_ptr<ImageCodec>& a, const std::unique_ptr<ImageCodec>& b) {
                         return a->getPriority() > b->getPriority();
                     });
    Log(DEBUG, "ImageCodec", "Registered image codec {}", name);
}

const ImageCodec& ImageCodecRegistry::codecForReading(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError(path, "Cannot open image");
    }
    std::vector<uint8_t> signature(16, 0);
    file.read(reinterpret_cast<char*>(signature.data()), static_cast<std::streamsize>(signature.size()));
    signature.resize(static_cast<size_t>(file.gcount()));

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& codec : codecs_) {
        if (codec->canRead(path, signature)) {
            Log(DEBUG, "ImageCodec", "{} reads {}", codec->getCodecName(), path);
            return *codec;
        }
    }

    const std::string extension = imageExtension(path);
    for (const auto& codec : codecs_) {
        if (codec->handlesExtension(extension)) {
            Log(DEBUG, "ImageCodec", "{} reads {} by extension", codec->getCodecName(), path);
            return *codec;
        }
    }
    throw IOError(path, "Unsupported image format");
}

const ImageCodec& ImageCodecRegistry::codecForWriting(const std::string& path) const {
    const std::string extension = imageExtension(path);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& codec : codecs_) {
        if (codec->handlesExtension(extension)) {
            return *codec;
        }
    }
    throw IOError(path, "No image codec writes '." + extension + "' files");
}

bool ImageCodecRegistry::isWritableExtension(const std::string& extension) const {
    if (extension.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(codecs_.begin(), codecs_.end(),
                       [&](const std::unique_ptr<ImageCodec>& codec) { return codec->handlesExtension(extension); });
}

std::vector<std::string> ImageCodecRegistry::getCodecNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& codec : codecs_) {
        names.push_back(codec->getCodecName());
    }
    return names;
}

cv::Mat ImageCodecRegistry::load(const std::string& path) const {
    cv::Mat image = codecForReading(path).load(path);
    Log(DEBUG, "ImageCodec", "Loaded {}: {}x{}", path, image.cols, image.rows);
    return image;
}

// Encodes into "<stem>.part.<ext>" beside the target; the target is only replaced on success
void ImageCodecRegistry::save(const std::string& path, const cv::Mat& rgb, const ImageWriteOptions& options) const {
    const ImageCodec& codec = codecForWriting(path);

    const std::filesystem::path target(path);
    std::filesystem::path temp = target;
    temp.replace_filename(target.stem().string() + ".part" + target.extension().string());

    std::error_code ec;
    try {
        codec.save(temp.string(), rgb, options);
    } catch (const std::exception&) {
        std::filesystem::remove(temp, ec);
        throw;
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(temp, removeEc);
        throw IOError(path, "Cannot move image into place (" + ec.message() + ")");
    }
    Log(DEBUG, "ImageCodec", "Saved {}: {}x{} at {} DPI", path, rgb.cols, rgb.rows, options.dpi);
}

} // namespace ByteBlock
