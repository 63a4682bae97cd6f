#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/Logging/Logging.h"

namespace ByteBlock {

// Macro for auto-registering image codecs
#define REGISTER_IMAGE_CODEC(CodecClass) \
    namespace { \
        struct CodecClass##_registrar { \
            CodecClass##_registrar() { \
                Log(DEBUG, "ImageCodec", "Auto-registering image codec: " #CodecClass); \
                ImageCodecRegistry::getInstance().registerCodec(#CodecClass, \
                    []() -> std::unique_ptr<ImageCodec> { \
                        return std::make_unique<CodecClass>(); \
                    }); \
            } \
        }; \
        static CodecClass##_registrar CodecClass##_instance; \
    }

struct ImageWriteOptions {
    int dpi = 0;              // 0 or negative: no resolution metadata
    int compressionLevel = 6; // 0-9, for lossless formats that support it
};

/**
 * @brief Abstract image reader/writer
 *
 * Pixel buffers crossing this interface are CV_8UC3 in RGB channel order. Every failure
 * is reported as IOError.
 */
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    virtual std::string getCodecName() const = 0;

    // Higher priority codecs are asked first
    virtual int getPriority() const { return 0; }

    // Content sniffing; signature holds up to the first 16 bytes of the file
    virtual bool canRead(const std::string& path, const std::vector<uint8_t>& signature) const = 0;

    // extension is lower case, without the dot
    virtual bool handlesExtension(const std::string& extension) const = 0;

    virtual cv::Mat load(const std::string& path) const = 0;
    virtual void save(const std::string& path, const cv::Mat& rgb, const ImageWriteOptions& options) const = 0;
};

class ImageCodecRegistry {
public:
    using CodecFactory = std::function<std::unique_ptr<ImageCodec>()>;

    static ImageCodecRegistry& getInstance() {
        static ImageCodecRegistry instance;
        return instance;
    }

    void registerCodec(const std::string& name, CodecFactory factory);

    /**
     * @brief Codec able to decode the file, chosen by signature then by extension
     * @throws IOError when the file is unreadable or no codec accepts it
     */
    const ImageCodec& codecForReading(const std::string& path) const;

    // @throws IOError when no codec writes the path's extension
    const ImageCodec& codecForWriting(const std::string& path) const;

    bool isWritableExtension(const std::string& extension) const;
    std::vector<std::string> getCodecNames() const;

    cv::Mat load(const std::string& path) const;
    void save(const std::string& path, const cv::Mat& rgb, const ImageWriteOptions& options) const;

private:
    ImageCodecRegistry() = default;
    ImageCodecRegistry(const ImageCodecRegistry&) = delete;
    ImageCodecRegistry& operator=(const ImageCodecRegistry&) = delete;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<ImageCodec>> codecs_;
};

// Lower-cased extension of a path, without the dot
std::string imageExtension(const std::string& path);

} // namespace ByteBlock
