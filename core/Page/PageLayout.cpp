#include "PageLayout.h"

#include <format>
#include <stdexcept>

#include "BlockCodec.h"
#include "core/Errors.h"
#include "core/Logging/Logging.h"

namespace ByteBlock {

namespace {

// Number of steps of (block + margin) that fit from margin before the wrap rule fires
size_t countSlots(int pageExtent, int blockExtent, int margin) {
    size_t slots = 0;
    for (int pos = margin; pos + blockExtent + margin <= pageExtent; pos += blockExtent + margin) {
        ++slots;
    }
    return slots;
}

} // namespace

BlockCursor::BlockCursor(const Geometry& geometry)
    : geometry_(geometry), x_(geometry.margin()), y_(geometry.margin()) {
    capacity_ = countSlots(geometry.pageWidth(), geometry.blockWidth(), geometry.margin()) *
                countSlots(geometry.pageHeight(), geometry.blockHeight(), geometry.margin());
}

cv::Point BlockCursor::next() {
    const int bw = geometry_.blockWidth();
    const int bh = geometry_.blockHeight();
    const int m = geometry_.margin();

    if (x_ + bw + m > geometry_.pageWidth()) {
        x_ = m;
        y_ += bh + m;
    }
    if (y_ + bh + m > geometry_.pageHeight()) {
        throw PageOverflowError(emitted_ + 1, capacity_);
    }

    cv::Point position(x_, y_);
    x_ += bw + m;
    ++emitted_;
    return position;
}

PageLayout::PageLayout(const Geometry& geometry)
    : geometry_(geometry) {
    columns_ = countSlots(geometry.pageWidth(), geometry.blockWidth(), geometry.margin());
    rows_ = countSlots(geometry.pageHeight(), geometry.blockHeight(), geometry.margin());
    Log(DEBUG, "PageLayout", "{} columns x {} rows = {} slots, {} data bytes",
        columns_, rows_, capacity(), dataCapacityBytes());
}

size_t PageLayout::dataCapacityBlocks() const {
    return capacity() > kFramingBlocks ? capacity() - kFramingBlocks : 0;
}

size_t PageLayout::dataCapacityBytes() const {
    return dataCapacityBlocks() * kBlockBytes;
}

size_t PageLayout::blocksForPayload(size_t payloadBytes) {
    return kFramingBlocks + (payloadBytes + kBlockBytes - 1) / kBlockBytes;
}

BlockKind PageLayout::blockKindAt(size_t slot, size_t dataBlocks) {
    if (slot == 0) {
        return BlockKind::Header;
    }
    if (slot > dataBlocks + 1) {
        throw std::out_of_range(std::format("Slot {} lies past the Footer of a {}-block payload", slot, dataBlocks));
    }
    return slot <= dataBlocks ? BlockKind::Data : BlockKind::Footer;
}

std::vector<cv::Point> PageLayout::placements(size_t count) const {
    if (count > capacity()) {
        throw PageOverflowError(count, capacity());
    }
    std::vector<cv::Point> positions;
    positions.reserve(count);
    BlockCursor cursor(geometry_);
    for (size_t i = 0; i < count; ++i) {
        positions.push_back(cursor.next());
    }
    return positions;
}

} // namespace ByteBlock
