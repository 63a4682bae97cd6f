// Raster traversal, capacity, overflow

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/Errors.h"
#include "core/Page/PageLayout.h"
#include "minitest.h"

using namespace ByteBlock;

static bool test_standard_capacity() {
    Geometry g;
    PageLayout layout(g);
    T_ASSERT(layout.columns() == 49);
    T_ASSERT(layout.rows() == 69);
    T_ASSERT(layout.capacity() == 3381);
    T_ASSERT(layout.dataCapacityBlocks() == 3379);
    T_ASSERT(layout.dataCapacityBytes() == 50685);
    return true;
}

static bool test_small_capacity() {
    Geometry g(Test::smallPageSpec());
    PageLayout layout(g);
    T_ASSERT(layout.columns() == 8);
    T_ASSERT(layout.rows() == 11);
    T_ASSERT(layout.capacity() == 88);
    T_ASSERT(layout.dataCapacityBytes() == 1290);
    return true;
}

static bool test_blocks_for_payload() {
    T_ASSERT(PageLayout::blocksForPayload(0) == 2);
    T_ASSERT(PageLayout::blocksForPayload(1) == 3);
    T_ASSERT(PageLayout::blocksForPayload(5) == 3);
    T_ASSERT(PageLayout::blocksForPayload(15) == 3);
    T_ASSERT(PageLayout::blocksForPayload(16) == 4);
    T_ASSERT(PageLayout::blocksForPayload(1290) == 88);
    return true;
}

static bool test_raster_order() {
    Geometry g(Test::smallPageSpec());
    PageLayout layout(g);
    const std::vector<cv::Point> positions = layout.placements(18);
    T_ASSERT(positions.size() == 18);
    T_ASSERT(positions[0] == cv::Point(25, 25));
    T_ASSERT(positions[1] == cv::Point(150, 25));
    T_ASSERT(positions[7] == cv::Point(900, 25));
    T_ASSERT(positions[8] == cv::Point(25, 150)); // wrapped
    T_ASSERT(positions[17] == cv::Point(150, 275));

    // The last slot sits in the 11th row, clear of the bottom margin
    const cv::Point last = layout.placements(88).back();
    T_ASSERT(last == cv::Point(900, 1275));
    T_ASSERT(last.y + g.blockHeight() + g.margin() <= g.pageHeight());
    return true;
}

static bool test_cursor_overflow() {
    Geometry g(Test::smallPageSpec());
    BlockCursor cursor(g);
    for (int i = 0; i < 88; ++i) {
        cursor.next();
    }
    T_ASSERT(cursor.emitted() == 88);
    try {
        cursor.next();
        T_ASSERT(false);
    } catch (const PageOverflowError& e) {
        T_ASSERT(e.requiredBlocks() == 89);
        T_ASSERT(e.capacity() == 88);
        T_ASSERT(e.kind() == ErrorKind::PageOverflow);
    }

    PageLayout layout(g);
    T_THROWS(layout.placements(89), PageOverflowError);
    T_ASSERT(layout.placements(0).empty());
    return true;
}

static bool test_block_kinds() {
    T_ASSERT(PageLayout::blockKindAt(0, 3) == BlockKind::Header);
    T_ASSERT(PageLayout::blockKindAt(1, 3) == BlockKind::Data);
    T_ASSERT(PageLayout::blockKindAt(3, 3) == BlockKind::Data);
    T_ASSERT(PageLayout::blockKindAt(4, 3) == BlockKind::Footer);
    T_THROWS(PageLayout::blockKindAt(5, 3), std::out_of_range);

    // Empty payload: the Footer follows the Header directly
    T_ASSERT(PageLayout::blockKindAt(0, 0) == BlockKind::Header);
    T_ASSERT(PageLayout::blockKindAt(1, 0) == BlockKind::Footer);

    T_ASSERT(std::string(blockKindName(BlockKind::Header)) == "Header");
    T_ASSERT(std::string(blockKindName(BlockKind::Data)) == "Data");
    T_ASSERT(std::string(blockKindName(BlockKind::Footer)) == "Footer");
    return true;
}

// Layouts and cursors keep their own copy of the geometry
static bool test_built_from_temporary_geometry() {
    PageLayout layout{Geometry(Test::smallPageSpec())};
    BlockCursor cursor{Geometry(Test::smallPageSpec())};
    const std::vector<cv::Point> positions = layout.placements(10);
    for (const cv::Point& p : positions) {
        T_ASSERT(cursor.next() == p);
    }
    T_ASSERT(positions.back() == cv::Point(150, 150));
    T_ASSERT(layout.capacity() == 88);
    return true;
}

int main() {
    bool ok = true;
    T_RUN(ok, test_standard_capacity);
    T_RUN(ok, test_small_capacity);
    T_RUN(ok, test_blocks_for_payload);
    T_RUN(ok, test_raster_order);
    T_RUN(ok, test_cursor_overflow);
    T_RUN(ok, test_block_kinds);
    T_RUN(ok, test_built_from_temporary_geometry);
    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
