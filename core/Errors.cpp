#include "Errors.h"

#include <format>

namespace ByteBlock {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PageOverflow: return "PageOverflow";
        case ErrorKind::HeaderDecode: return "HeaderDecodeError";
        case ErrorKind::Integrity: return "IntegrityError";
        case ErrorKind::IO: return "IOError";
        case ErrorKind::InvalidGeometry: return "InvalidGeometry";
        default: return "Unknown";
    }
}

PageOverflowError::PageOverflowError(size_t requiredBlocks, size_t capacity)
    : ByteBlockError(ErrorKind::PageOverflow,
                     std::format("File too large to fit on single page: needs {} blocks, page holds {}",
                                 requiredBlocks, capacity)),
      requiredBlocks_(requiredBlocks), capacity_(capacity) {}

IntegrityError::IntegrityError(uint64_t storedChecksum, uint64_t computedChecksum,
                               const std::string& namePrefix, const std::string& extension,
                               uint32_t fileSize)
    : ByteBlockError(ErrorKind::Integrity,
                     std::format("Footer verification failed for {}.{} ({} bytes): stored checksum {}, computed {}",
                                 namePrefix, extension, fileSize, storedChecksum, computedChecksum)),
      storedChecksum_(storedChecksum), computedChecksum_(computedChecksum),
      namePrefix_(namePrefix), extension_(extension), fileSize_(fileSize) {}

} // namespace ByteBlock
