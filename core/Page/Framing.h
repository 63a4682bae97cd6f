#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "BlockCodec.h"

namespace ByteBlock {

constexpr size_t kNameFieldBytes = 5;
constexpr size_t kExtensionFieldBytes = 4;
constexpr size_t kSizeFieldBytes = 3;
constexpr size_t kChecksumFieldBytes = 6;

constexpr uint32_t kMaxFileSize = 0xFFFFFF;           // 16 MiB - 1
constexpr uint32_t kMaxBlockCount = 0xFFFFFF;
constexpr uint64_t kChecksumMask = 0xFFFFFFFFFFFFULL; // 2^48 - 1

// Header layout: [0,5) name prefix, [5,9) extension, [9,12) file size, [12,15) data blocks
struct HeaderFields {
    std::string namePrefix;
    std::string extension;
    uint32_t fileSize = 0;
    uint32_t blockCount = 0;
};

// Footer layout: [0,5) name suffix, [5,9) extension, [9,15) checksum
struct FooterFields {
    std::string nameSuffix;
    std::string extension;
    uint64_t checksum = 0;
};

/**
 * @brief Split a file path into base name and extension
 *
 * Only the last path component is considered. The extension is whatever follows the
 * last dot, without the dot; a leading dot belongs to the base name (".profile").
 */
std::pair<std::string, std::string> splitFileName(const std::string& path);

/**
 * @brief Decode a zero-padded text field
 *
 * Invalid UTF-8 sequences are dropped instead of failing, then trailing NUL bytes are
 * trimmed.
 */
std::string decodeTextField(const uint8_t* bytes, size_t length);

// Additive checksum: sum of all bytes modulo 2^48. Order independent, so byte swaps
// and many multi-byte error patterns go undetected.
uint64_t checksum(const std::vector<uint8_t>& data);

// Names and extensions longer than their fields are silently truncated
Block buildHeader(const std::string& baseName, const std::string& extension,
                  uint32_t fileSize, uint32_t blockCount);
HeaderFields parseHeader(const Block& block);

Block buildFooter(const std::string& baseName, const std::string& extension,
                  const std::vector<uint8_t>& trimmedData);
FooterFields parseFooter(const Block& block);

/**
 * @brief Check the footer checksum against the trimmed file bytes
 * @param header Decoded header, used only to report name/extension mismatches
 * @param stored Receives the decoded footer fields when non-null
 * @return true when the checksums match; name and extension never affect the result
 */
bool verifyFooter(const Block& block, const std::vector<uint8_t>& trimmedData,
                  const HeaderFields& header, FooterFields* stored = nullptr);

} // namespace ByteBlock
