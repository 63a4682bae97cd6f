#pragma once

#include <cstddef>
#include <vector>

#include <opencv2/core.hpp>

#include "BlockCodec.h"
#include "Geometry.h"

namespace ByteBlock {

/**
 * @brief Replays the raster traversal of block positions
 *
 * Starts at (margin, margin) and moves left to right, wrapping to the next row when a
 * block plus its trailing margin would cross the page width. Encoder and decoder both
 * walk a cursor, so a block's position follows from its ordinal index alone.
 */
class BlockCursor {
public:
    explicit BlockCursor(const Geometry& geometry);

    /**
     * @brief Position of the next block in traversal order
     * @throws PageOverflowError when the block would cross the page height
     */
    cv::Point next();

    size_t emitted() const { return emitted_; }

private:
    Geometry geometry_;
    int x_;
    int y_;
    size_t emitted_ = 0;
    size_t capacity_;
};

class PageLayout {
public:
    // Header and Footer each take one slot
    static constexpr size_t kFramingBlocks = 2;

    explicit PageLayout(const Geometry& geometry);

    size_t columns() const { return columns_; }
    size_t rows() const { return rows_; }
    size_t capacity() const { return columns_ * rows_; }
    size_t dataCapacityBlocks() const;
    size_t dataCapacityBytes() const;

    // Blocks needed for a payload: Header + ceil(size / 15) Data + Footer
    static size_t blocksForPayload(size_t payloadBytes);

    // Slot 0 is the Header, the next dataBlocks slots are Data, the one after is the Footer
    static BlockKind blockKindAt(size_t slot, size_t dataBlocks);

    /**
     * @brief Positions of the first count blocks
     * @throws PageOverflowError when count exceeds the page capacity
     */
    std::vector<cv::Point> placements(size_t count) const;

private:
    Geometry geometry_;
    size_t columns_ = 0;
    size_t rows_ = 0;
};

} // namespace ByteBlock
