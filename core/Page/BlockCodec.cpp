#include "BlockCodec.h"

#include <cmath>

#include <opencv2/imgproc.hpp>

namespace ByteBlock {

const char* blockKindName(BlockKind kind) {
    switch (kind) {
        case BlockKind::Header: return "Header";
        case BlockKind::Data: return "Data";
        case BlockKind::Footer: return "Footer";
        default: return "Unknown";
    }
}

BlockColors blockToColors(const Block& block) {
    BlockColors colors;
    for (size_t i = 0; i < colors.size(); ++i) {
        colors[i] = Rgb{block[i * kBytesPerRegion],
                        block[i * kBytesPerRegion + 1],
                        block[i * kBytesPerRegion + 2]};
    }
    return colors;
}

Block colorsToBlock(const BlockColors& colors) {
    Block block{};
    for (size_t i = 0; i < colors.size(); ++i) {
        block[i * kBytesPerRegion] = colors[i].r;
        block[i * kBytesPerRegion + 1] = colors[i].g;
        block[i * kBytesPerRegion + 2] = colors[i].b;
    }
    return block;
}

void drawBlock(cv::Mat& canvas, const Geometry& geometry, cv::Point origin, const Block& block) {
    const cv::Rect square(origin.x, origin.y, geometry.blockWidth(), geometry.blockHeight());
    // Work in block-local coordinates; the ROI clips the closing polygon edges
    cv::Mat roi = canvas(square & cv::Rect(0, 0, canvas.cols, canvas.rows));
    const BlockColors colors = blockToColors(block);

    for (Region region : kRegionOrder) {
        const Rgb& c = colors[static_cast<int>(region)];
        const cv::Scalar fill(c.r, c.g, c.b);
        if (region == Region::Inner) {
            cv::rectangle(roi, geometry.innerRect(), fill, cv::FILLED);
        } else {
            const RegionPolygon& polygon = geometry.regionPolygon(region);
            cv::fillConvexPoly(roi, polygon.data(), static_cast<int>(polygon.size()), fill);
        }
    }

    cv::rectangle(canvas, cv::Point(origin.x - 1, origin.y - 1),
                  cv::Point(origin.x + geometry.blockWidth(), origin.y + geometry.blockHeight()),
                  cv::Scalar(0, 0, 0), 1);
}

Rgb averageColor(const cv::Mat& image, const cv::Rect& area) {
    const cv::Rect clipped = area & cv::Rect(0, 0, image.cols, image.rows);
    if (clipped.area() <= 0) {
        return Rgb{};
    }
    const cv::Scalar mean = cv::mean(image(clipped));
    auto channel = [](double value) -> uint8_t {
        long rounded = std::lround(value);
        if (rounded < 0) return 0;
        if (rounded > 255) return 255;
        return static_cast<uint8_t>(rounded);
    };
    return Rgb{channel(mean[0]), channel(mean[1]), channel(mean[2])};
}

Block sampleBlock(const cv::Mat& image, const Geometry& geometry, cv::Point origin) {
    BlockColors colors;
    for (Region region : kRegionOrder) {
        const cv::Rect sample = geometry.sampleRect(region) + origin;
        colors[static_cast<int>(region)] = averageColor(image, sample);
    }
    return colorsToBlock(colors);
}

} // namespace ByteBlock
