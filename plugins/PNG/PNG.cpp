#include "PNG.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <memory>

#include <png.h>
#include <zlib.h>

#include "core/Errors.h"
#include "core/Logging/Logging.h"

namespace ByteBlock {

namespace {

// Lives on the heap so nothing between setjmp and png_longjmp needs a destructor
struct PngState {
    cv::Mat image;
    int rowsRead = 0;
    bool headerDone = false;
    std::string message;
};

void pngError(png_structp png_ptr, png_const_charp message) {
    auto* state = static_cast<PngState*>(png_get_error_ptr(png_ptr));
    if (state) {
        state->message = message ? message : "unknown libpng error";
    }
    png_longjmp(png_ptr, 1);
}

void pngWarning(png_structp, png_const_charp message) {
    Log(DEBUG, "PNG", "libpng: {}", message ? message : "");
}

} // namespace

uint32_t PNG::dpiToPixelsPerMeter(int dpi) {
    return static_cast<uint32_t>(std::lround(dpi / 0.0254));
}

bool PNG::canRead(const std::string&, const std::vector<uint8_t>& signature) const {
    return signature.size() >= 8 && png_sig_cmp(signature.data(), 0, 8) == 0;
}

cv::Mat PNG::load(const std::string& path) const {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        throw IOError(path, "Cannot open file");
    }

    // Check PNG signature
    uint8_t header[8];
    if (fread(header, 1, 8, file) != 8 || png_sig_cmp(header, 0, 8)) {
        fclose(file);
        throw IOError(path, "File is not a PNG file");
    }

    auto state = std::make_unique<PngState>();
    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, state.get(), pngError, pngWarning);
    if (!png_ptr) {
        fclose(file);
        throw IOError(path, "Cannot create PNG read struct");
    }

    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_read_struct(&png_ptr, nullptr, nullptr);
        fclose(file);
        throw IOError(path, "Cannot create PNG info struct");
    }

    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        fclose(file);
        if (!state->headerDone) {
            throw IOError(path, "Cannot decode PNG (" + state->message + ")");
        }
        Log(WARNING, "PNG", "{} is truncated ({}): read {} of {} rows, the rest is left black",
            path, state->message, state->rowsRead, state->image.rows);
        return state->image;
    }

    png_init_io(png_ptr, file);
    png_set_sig_bytes(png_ptr, 8);
    png_read_info(png_ptr, info_ptr);

    png_uint_32 width = png_get_image_width(png_ptr, info_ptr);
    png_uint_32 height = png_get_image_height(png_ptr, info_ptr);
    png_byte color_type = png_get_color_type(png_ptr, info_ptr);
    png_byte bit_depth = png_get_bit_depth(png_ptr, info_ptr);

    // Convert to RGB 8-bit
    if (bit_depth == 16) {
        png_set_strip_16(png_ptr);
    }

    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(png_ptr);
    }

    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
        png_set_expand_gray_1_2_4_to_8(png_ptr);
    }

    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
        png_set_gray_to_rgb(png_ptr);
    }

    if (color_type & PNG_COLOR_MASK_ALPHA) {
        png_set_strip_alpha(png_ptr);
    }

    int passes = png_set_interlace_handling(png_ptr);
    png_read_update_info(png_ptr, info_ptr);

    if (png_get_channels(png_ptr, info_ptr) != 3 || png_get_rowbytes(png_ptr, info_ptr) != width * 3) {
        png_error(png_ptr, "unsupported pixel layout after RGB conversion");
    }

    state->image = cv::Mat::zeros(static_cast<int>(height), static_cast<int>(width), CV_8UC3);
    state->headerDone = true;

    for (int pass = 0; pass < passes; pass++) {
        for (int y = 0; y < static_cast<int>(height); y++) {
            png_read_row(png_ptr, state->image.ptr<uint8_t>(y), nullptr);
            if (pass == passes - 1) {
                state->rowsRead = y + 1;
            }
        }
    }

    png_read_end(png_ptr, nullptr);

    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    fclose(file);

    return state->image;
}

void PNG::save(const std::string& path, const cv::Mat& rgb, const ImageWriteOptions& options) const {
    // libpng doesn't handle writing 0x0 files well
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw IOError(path, "Expected a non-empty 8-bit RGB image");
    }

    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        throw IOError(path, "Cannot create file");
    }

    auto state = std::make_unique<PngState>();
    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, state.get(), pngError, pngWarning);
    if (!png_ptr) {
        fclose(file);
        throw IOError(path, "Cannot create PNG write struct");
    }

    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        fclose(file);
        throw IOError(path, "Cannot create PNG info struct");
    }

    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        fclose(file);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw IOError(path, "Cannot encode PNG (" + state->message + ")");
    }

    png_init_io(png_ptr, file);
    png_set_compression_level(png_ptr, std::clamp(options.compressionLevel, Z_NO_COMPRESSION, Z_BEST_COMPRESSION));

    png_set_IHDR(png_ptr, info_ptr, static_cast<png_uint_32>(rgb.cols), static_cast<png_uint_32>(rgb.rows), 8,
                 PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

    if (options.dpi > 0) {
        png_uint_32 ppm = dpiToPixelsPerMeter(options.dpi);
        png_set_pHYs(png_ptr, info_ptr, ppm, ppm, PNG_RESOLUTION_METER);
    }

    png_write_info(png_ptr, info_ptr);

    for (int y = 0; y < rgb.rows; y++) {
        png_write_row(png_ptr, rgb.ptr<uint8_t>(y));
    }

    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);

    if (fclose(file) != 0) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw IOError(path, "Cannot flush PNG file");
    }
}

REGISTER_IMAGE_CODEC(PNG)

} // namespace ByteBlock
