#pragma once

#include <array>
#include <cstdint>

#include <opencv2/core.hpp>

namespace ByteBlock {

/**
 * @brief Physical description of the printed page and of a single block
 *
 * All values except the paper size are in pixels at the given DPI.
 */
struct PageSpec {
    int dpi = 2550;
    double paperWidthMm = 210.0;
    double paperHeightMm = 297.0;
    int margin = 125;
    int blockWidth = 300;
    int blockHeight = 300;
    int sampleInset = 5;

    // Build-time constants shared by encoder and decoder
    static PageSpec standard() { return PageSpec(); }
};

// Regions in byte order: region i carries bytes [3i, 3i+3) of a block
enum class Region : int {
    Top = 0,
    Bottom = 1,
    Right = 2,
    Left = 3,
    Inner = 4
};

constexpr int kRegionCount = 5;
constexpr std::array<Region, kRegionCount> kRegionOrder = {
    Region::Top, Region::Bottom, Region::Right, Region::Left, Region::Inner
};

const char* regionName(Region region);

using RegionPolygon = std::array<cv::Point, 4>;

/**
 * @brief Immutable page and block geometry
 *
 * Computed once from a PageSpec and shared by encoder, decoder and layout. Every
 * per-block quantity is expressed in block-local coordinates (origin at the block's
 * top-left corner); callers offset by the block origin.
 */
class Geometry {
public:
    static constexpr double kInnerScale = 0.7071067811865476; // sqrt(0.5)

    explicit Geometry(const PageSpec& spec = PageSpec::standard());

    const PageSpec& spec() const { return spec_; }
    int dpi() const { return spec_.dpi; }
    int pageWidth() const { return pageWidth_; }
    int pageHeight() const { return pageHeight_; }
    int margin() const { return spec_.margin; }
    int blockWidth() const { return spec_.blockWidth; }
    int blockHeight() const { return spec_.blockHeight; }
    int sampleInset() const { return spec_.sampleInset; }

    // Centred inner rectangle, half the block area
    const cv::Rect& innerRect() const { return inner_; }

    // Polygon in corner coordinates: the block square spans [0, blockWidth] x [0, blockHeight]
    const RegionPolygon& regionPolygon(Region region) const { return polygons_[static_cast<int>(region)]; }

    const cv::Rect& regionBounds(Region region) const { return bounds_[static_cast<int>(region)]; }

    // Pixels averaged on decode; may be empty for tiny blocks
    const cv::Rect& sampleRect(Region region) const { return samples_[static_cast<int>(region)]; }

    /**
     * @brief Region owning the block-local pixel (u, v)
     *
     * The five regions partition the block square exactly. Pixels whose centre lies on a
     * diagonal go to the first candidate in byte order.
     */
    Region regionAt(int u, int v) const;

    bool operator==(const Geometry& other) const;

private:
    PageSpec spec_;
    int pageWidth_ = 0;
    int pageHeight_ = 0;
    cv::Rect inner_;
    std::array<RegionPolygon, kRegionCount> polygons_;
    std::array<cv::Rect, kRegionCount> bounds_;
    std::array<cv::Rect, kRegionCount> samples_;

    void validate() const;
};

} // namespace ByteBlock
