// Geometry: page size, region partition, sampling rectangles

#include <array>
#include <iostream>
#include <vector>

#include <opencv2/imgproc.hpp>

#include "core/Errors.h"
#include "core/Page/Geometry.h"
#include "minitest.h"

using namespace ByteBlock;

static bool test_standard_dimensions() {
    Geometry g;
    T_ASSERT(g.dpi() == 2550);
    T_ASSERT(g.pageWidth() == 21082);
    T_ASSERT(g.pageHeight() == 29816);
    T_ASSERT(g.margin() == 125);
    T_ASSERT(g.blockWidth() == 300 && g.blockHeight() == 300);
    T_ASSERT(g.innerRect() == cv::Rect(44, 44, 212, 212));
    T_ASSERT(g.sampleRect(Region::Top) == cv::Rect(80, 5, 140, 34));
    T_ASSERT(g.sampleRect(Region::Inner) == cv::Rect(102, 102, 96, 96));
    T_ASSERT(g == Geometry(PageSpec::standard()));
    return true;
}

static bool test_small_sample_rects() {
    Geometry g(Test::smallPageSpec());
    T_ASSERT(g.pageWidth() == 1050 && g.pageHeight() == 1485);
    T_ASSERT(g.innerRect() == cv::Rect(15, 15, 70, 70));
    T_ASSERT(g.sampleRect(Region::Top) == cv::Rect(30, 5, 40, 5));
    T_ASSERT(g.sampleRect(Region::Bottom) == cv::Rect(30, 90, 40, 5));
    T_ASSERT(g.sampleRect(Region::Right) == cv::Rect(90, 30, 5, 40));
    T_ASSERT(g.sampleRect(Region::Left) == cv::Rect(5, 30, 5, 40));
    T_ASSERT(g.sampleRect(Region::Inner) == cv::Rect(37, 37, 25, 25));
    T_ASSERT(!(g == Geometry()));
    T_ASSERT(g.spec().dpi == 127 && g.spec().paperWidthMm == 210.0);
    return true;
}

// Inner area is half the block, give or take the floor on each side
static bool test_inner_area_ratio() {
    Geometry g;
    const double ratio = static_cast<double>(g.innerRect().area()) / (g.blockWidth() * g.blockHeight());
    T_ASSERT(ratio > 0.49 && ratio <= 0.5);
    return true;
}

// Every pixel belongs to exactly one region, consistent with the polygons
static bool test_regions_tile_block() {
    for (const PageSpec& spec : {Test::smallPageSpec(), PageSpec::standard()}) {
        Geometry g(spec);
        std::array<std::vector<cv::Point2f>, kRegionCount> polygons;
        for (Region region : kRegionOrder) {
            for (const cv::Point& p : g.regionPolygon(region)) {
                polygons[static_cast<int>(region)].emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
            }
        }

        std::array<long, kRegionCount> counts{};
        for (int v = 0; v < g.blockHeight(); ++v) {
            for (int u = 0; u < g.blockWidth(); ++u) {
                const Region owner = g.regionAt(u, v);
                counts[static_cast<int>(owner)]++;
                const cv::Point2f centre(u + 0.5f, v + 0.5f);
                for (Region region : kRegionOrder) {
                    const double inside = cv::pointPolygonTest(polygons[static_cast<int>(region)], centre, false);
                    // Strictly inside one polygon means owned by it; on an edge only the owner may claim it
                    if (inside > 0) T_ASSERT(owner == region);
                }
                T_ASSERT(cv::pointPolygonTest(polygons[static_cast<int>(owner)], centre, false) >= 0);
            }
        }

        long total = 0;
        for (long c : counts) {
            T_ASSERT(c > 0);
            total += c;
        }
        T_ASSERT(total == static_cast<long>(g.blockWidth()) * g.blockHeight());
        T_ASSERT(counts[static_cast<int>(Region::Inner)] == g.innerRect().area());
    }
    return true;
}

static bool test_samples_inside_regions() {
    for (const PageSpec& spec : {Test::smallPageSpec(), PageSpec::standard()}) {
        Geometry g(spec);
        for (Region region : kRegionOrder) {
            const cv::Rect sample = g.sampleRect(region);
            T_ASSERT(sample.area() > 0);
            T_ASSERT((sample & g.regionBounds(region)) == sample);
            for (int v = sample.y; v < sample.y + sample.height; ++v) {
                for (int u = sample.x; u < sample.x + sample.width; ++u) {
                    T_ASSERT(g.regionAt(u, v) == region);
                }
            }
        }
    }
    return true;
}

static bool test_invalid_geometry() {
    PageSpec tiny = Test::smallPageSpec();
    tiny.blockWidth = 2;
    tiny.blockHeight = 2;
    T_THROWS(Geometry{tiny}, InvalidGeometryError);

    PageSpec noMargin = Test::smallPageSpec();
    noMargin.margin = 0;
    T_THROWS(Geometry{noMargin}, InvalidGeometryError);

    PageSpec wideInset = Test::smallPageSpec();
    wideInset.sampleInset = 40;
    T_THROWS(Geometry{wideInset}, InvalidGeometryError);

    PageSpec noDpi = Test::smallPageSpec();
    noDpi.dpi = 0;
    T_THROWS(Geometry{noDpi}, InvalidGeometryError);

    PageSpec hugeBlock = Test::smallPageSpec();
    hugeBlock.blockWidth = 1100;
    T_THROWS(Geometry{hugeBlock}, InvalidGeometryError);

    try {
        Geometry{tiny};
    } catch (const ByteBlockError& e) {
        T_ASSERT(e.kind() == ErrorKind::InvalidGeometry);
    }
    return true;
}

int main() {
    bool ok = true;
    T_RUN(ok, test_standard_dimensions);
    T_RUN(ok, test_small_sample_rects);
    T_RUN(ok, test_inner_area_ratio);
    T_RUN(ok, test_regions_tile_block);
    T_RUN(ok, test_samples_inside_regions);
    T_RUN(ok, test_invalid_geometry);
    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
