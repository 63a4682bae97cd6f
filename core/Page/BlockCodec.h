#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <opencv2/core.hpp>

#include "Geometry.h"

namespace ByteBlock {

constexpr size_t kBlockBytes = 15;
constexpr size_t kBytesPerRegion = 3;

using Block = std::array<uint8_t, kBlockBytes>;

enum class BlockKind {
    Header,
    Data,
    Footer
};

const char* blockKindName(BlockKind kind);

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& other) const = default;
};

using BlockColors = std::array<Rgb, kRegionCount>;

BlockColors blockToColors(const Block& block);
Block colorsToBlock(const BlockColors& colors);

/**
 * @brief Paint one block onto an RGB page canvas
 * @param canvas CV_8UC3 image in RGB channel order
 * @param origin Top-left pixel of the block square
 *
 * Each region polygon is filled with its exact colour; the block square is then framed
 * by a black outline one pixel outside it, which never touches a sampled pixel.
 */
void drawBlock(cv::Mat& canvas, const Geometry& geometry, cv::Point origin, const Block& block);

/**
 * @brief Mean colour over a rectangle, clipped to the image
 *
 * Each channel mean is rounded to the nearest integer. An empty (or fully clipped)
 * rectangle yields black.
 */
Rgb averageColor(const cv::Mat& image, const cv::Rect& area);

// Averages every region's sampling rectangle back into the 15 block bytes
Block sampleBlock(const cv::Mat& image, const Geometry& geometry, cv::Point origin);

} // namespace ByteBlock
