#include "Geometry.h"

#include <format>

#include "core/Errors.h"
#include "core/Logging/Logging.h"

namespace ByteBlock {

const char* regionName(Region region) {
    switch (region) {
        case Region::Top: return "Top";
        case Region::Bottom: return "Bottom";
        case Region::Right: return "Right";
        case Region::Left: return "Left";
        case Region::Inner: return "Inner";
        default: return "Unknown";
    }
}

namespace {

// Shrink the half-open span [x1, x2) x [y1, y2) by inset on every side
cv::Rect insetSpan(int x1, int y1, int x2, int y2, int inset) {
    int left = x1 + inset;
    int top = y1 + inset;
    int right = x2 - inset;
    int bottom = y2 - inset;
    if (right <= left || bottom <= top) {
        return cv::Rect();
    }
    return cv::Rect(left, top, right - left, bottom - top);
}

// a/b < c/d for positive denominators
bool fractionLess(int64_t a, int64_t b, int64_t c, int64_t d) {
    return a * d < c * b;
}

} // namespace

Geometry::Geometry(const PageSpec& spec)
    : spec_(spec) {
    pageWidth_ = static_cast<int>(spec_.paperWidthMm * spec_.dpi / 25.4);
    pageHeight_ = static_cast<int>(spec_.paperHeightMm * spec_.dpi / 25.4);

    const int w = spec_.blockWidth;
    const int h = spec_.blockHeight;
    const int innerW = static_cast<int>(w * kInnerScale);
    const int innerH = static_cast<int>(h * kInnerScale);
    const int ix = (w - innerW) / 2;
    const int iy = (h - innerH) / 2;
    inner_ = cv::Rect(ix, iy, innerW, innerH);

    polygons_[static_cast<int>(Region::Top)] = {
        cv::Point(0, 0), cv::Point(w, 0), cv::Point(ix + innerW, iy), cv::Point(ix, iy)};
    polygons_[static_cast<int>(Region::Bottom)] = {
        cv::Point(0, h), cv::Point(ix, iy + innerH), cv::Point(ix + innerW, iy + innerH), cv::Point(w, h)};
    polygons_[static_cast<int>(Region::Right)] = {
        cv::Point(w, 0), cv::Point(w, h), cv::Point(ix + innerW, iy + innerH), cv::Point(ix + innerW, iy)};
    polygons_[static_cast<int>(Region::Left)] = {
        cv::Point(0, 0), cv::Point(ix, iy), cv::Point(ix, iy + innerH), cv::Point(0, h)};
    polygons_[static_cast<int>(Region::Inner)] = {
        cv::Point(ix, iy), cv::Point(ix + innerW, iy), cv::Point(ix + innerW, iy + innerH), cv::Point(ix, iy + innerH)};

    bounds_[static_cast<int>(Region::Top)] = cv::Rect(0, 0, w, iy);
    bounds_[static_cast<int>(Region::Bottom)] = cv::Rect(0, iy + innerH, w, h - iy - innerH);
    bounds_[static_cast<int>(Region::Right)] = cv::Rect(ix + innerW, 0, w - ix - innerW, h);
    bounds_[static_cast<int>(Region::Left)] = cv::Rect(0, 0, ix, h);
    bounds_[static_cast<int>(Region::Inner)] = inner_;

    // Central half of each trapezoid along its long axis, central half of the inner
    // rectangle on both axes, then the inset against anti-aliased edges
    const int m = spec_.sampleInset;
    samples_[static_cast<int>(Region::Top)] = insetSpan(w / 4, 0, 3 * w / 4, iy, m);
    samples_[static_cast<int>(Region::Bottom)] = insetSpan(w / 4, iy + innerH, 3 * w / 4, h, m);
    samples_[static_cast<int>(Region::Right)] = insetSpan(ix + innerW, h / 4, w, 3 * h / 4, m);
    samples_[static_cast<int>(Region::Left)] = insetSpan(0, h / 4, ix, 3 * h / 4, m);
    samples_[static_cast<int>(Region::Inner)] =
        insetSpan(ix + innerW / 4, iy + innerH / 4, ix + 3 * innerW / 4, iy + 3 * innerH / 4, m);

    validate();

    Log(DEBUG, "Geometry", "Page {}x{} px at {} DPI, block {}x{}, inner {}x{} at ({},{}), margin {}",
        pageWidth_, pageHeight_, spec_.dpi, w, h, innerW, innerH, ix, iy, spec_.margin);
}

void Geometry::validate() const {
    if (spec_.dpi <= 0 || spec_.paperWidthMm <= 0.0 || spec_.paperHeightMm <= 0.0) {
        throw InvalidGeometryError(std::format("Invalid page: {} DPI, {}x{} mm",
                                               spec_.dpi, spec_.paperWidthMm, spec_.paperHeightMm));
    }
    if (spec_.margin < 1 || spec_.sampleInset < 0) {
        throw InvalidGeometryError(std::format("Invalid margin {} or sample inset {}",
                                               spec_.margin, spec_.sampleInset));
    }
    // Every trapezoid needs a non-zero depth for regionAt and for sampling
    const int rightMargin = spec_.blockWidth - inner_.x - inner_.width;
    const int bottomMargin = spec_.blockHeight - inner_.y - inner_.height;
    if (inner_.x < 1 || inner_.y < 1 || rightMargin < 1 || bottomMargin < 1) {
        throw InvalidGeometryError(std::format("Block {}x{} too small for five regions",
                                               spec_.blockWidth, spec_.blockHeight));
    }
    for (Region region : kRegionOrder) {
        if (sampleRect(region).area() <= 0) {
            throw InvalidGeometryError(std::format("Block {}x{} leaves no sampling area for region {} with inset {}",
                                                   spec_.blockWidth, spec_.blockHeight,
                                                   regionName(region), spec_.sampleInset));
        }
    }
    if (pageWidth_ < spec_.blockWidth + 2 * spec_.margin ||
        pageHeight_ < spec_.blockHeight + 2 * spec_.margin) {
        throw InvalidGeometryError(std::format("Page {}x{} cannot hold a single {}x{} block with margin {}",
                                               pageWidth_, pageHeight_, spec_.blockWidth,
                                               spec_.blockHeight, spec_.margin));
    }
}

Region Geometry::regionAt(int u, int v) const {
    if (inner_.contains(cv::Point(u, v))) {
        return Region::Inner;
    }

    // Normalised depth of the pixel centre into each trapezoid, as fraction num/den.
    // The diagonals joining outer and inner corners are the loci of equal depth.
    const int64_t w = spec_.blockWidth;
    const int64_t h = spec_.blockHeight;
    const int64_t topDepth = inner_.y;
    const int64_t bottomDepth = h - inner_.y - inner_.height;
    const int64_t leftDepth = inner_.x;
    const int64_t rightDepth = w - inner_.x - inner_.width;

    struct Candidate {
        Region region;
        int64_t num;
        int64_t den;
    };
    const Candidate candidates[] = {
        {Region::Top, 2 * static_cast<int64_t>(v) + 1, 2 * topDepth},
        {Region::Bottom, 2 * (h - 1 - v) + 1, 2 * bottomDepth},
        {Region::Right, 2 * (w - 1 - u) + 1, 2 * rightDepth},
        {Region::Left, 2 * static_cast<int64_t>(u) + 1, 2 * leftDepth},
    };

    const Candidate* best = &candidates[0];
    for (const auto& candidate : candidates) {
        if (fractionLess(candidate.num, candidate.den, best->num, best->den)) {
            best = &candidate;
        }
    }
    return best->region;
}

bool Geometry::operator==(const Geometry& other) const {
    return spec_.dpi == other.spec_.dpi &&
           spec_.paperWidthMm == other.spec_.paperWidthMm &&
           spec_.paperHeightMm == other.spec_.paperHeightMm &&
           spec_.margin == other.spec_.margin &&
           spec_.blockWidth == other.spec_.blockWidth &&
           spec_.blockHeight == other.spec_.blockHeight &&
           spec_.sampleInset == other.spec_.sampleInset;
}

} // namespace ByteBlock
