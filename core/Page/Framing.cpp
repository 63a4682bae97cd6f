#include "Framing.h"

#include <algorithm>
#include <format>
#include <numeric>

#include "core/Logging/Logging.h"

namespace ByteBlock {

namespace {

void writeBigEndian(uint8_t* out, uint64_t value, size_t length) {
    for (size_t i = 0; i < length; ++i) {
        out[i] = static_cast<uint8_t>((value >> (8 * (length - 1 - i))) & 0xFF);
    }
}

uint64_t readBigEndian(const uint8_t* in, size_t length) {
    uint64_t value = 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | in[i];
    }
    return value;
}

void writeTextField(uint8_t* out, const std::string& text, size_t length) {
    size_t count = std::min(text.size(), length);
    std::copy_n(reinterpret_cast<const uint8_t*>(text.data()), count, out);
}

std::string hexBytes(const uint8_t* bytes, size_t length) {
    std::string out;
    for (size_t i = 0; i < length; ++i) {
        if (i) out += ' ';
        out += std::format("{:02x}", bytes[i]);
    }
    return out;
}

// Length of the well-formed UTF-8 sequence starting at bytes[0], or 0 if malformed
size_t utf8SequenceLength(const uint8_t* bytes, size_t available) {
    const uint8_t lead = bytes[0];
    size_t length = 0;
    uint8_t minSecond = 0x80;
    uint8_t maxSecond = 0xBF;

    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) minSecond = 0xA0;
        if (lead == 0xED) maxSecond = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) minSecond = 0x90;
        if (lead == 0xF4) maxSecond = 0x8F;
    } else {
        return 0;
    }

    if (available < length) {
        return 0;
    }
    if (bytes[1] < minSecond || bytes[1] > maxSecond) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if (bytes[i] < 0x80 || bytes[i] > 0xBF) {
            return 0;
        }
    }
    return length;
}

} // namespace

std::pair<std::string, std::string> splitFileName(const std::string& path) {
    std::string name = path;
    size_t slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }

    // Skip leading dots so ".profile" has no extension
    size_t firstNonDot = name.find_first_not_of('.');
    if (firstNonDot == std::string::npos) {
        return {name, ""};
    }
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot < firstNonDot) {
        return {name, ""};
    }
    return {name.substr(0, dot), name.substr(dot + 1)};
}

std::string decodeTextField(const uint8_t* bytes, size_t length) {
    std::string text;
    size_t i = 0;
    while (i < length) {
        size_t sequence = utf8SequenceLength(bytes + i, length - i);
        if (sequence == 0) {
            ++i;
            continue;
        }
        text.append(reinterpret_cast<const char*>(bytes + i), sequence);
        i += sequence;
    }
    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
    return text;
}

uint64_t checksum(const std::vector<uint8_t>& data) {
    // 2^64 / 255 bytes would be needed to overflow before masking
    uint64_t sum = std::accumulate(data.begin(), data.end(), uint64_t{0});
    return sum & kChecksumMask;
}

Block buildHeader(const std::string& baseName, const std::string& extension,
                  uint32_t fileSize, uint32_t blockCount) {
    Block header{};
    writeTextField(header.data(), baseName, kNameFieldBytes);
    writeTextField(header.data() + kNameFieldBytes, extension, kExtensionFieldBytes);
    writeBigEndian(header.data() + 9, fileSize & kMaxFileSize, kSizeFieldBytes);
    writeBigEndian(header.data() + 12, blockCount & kMaxBlockCount, kSizeFieldBytes);
    return header;
}

HeaderFields parseHeader(const Block& block) {
    HeaderFields fields;
    fields.namePrefix = decodeTextField(block.data(), kNameFieldBytes);
    fields.extension = decodeTextField(block.data() + kNameFieldBytes, kExtensionFieldBytes);
    fields.fileSize = static_cast<uint32_t>(readBigEndian(block.data() + 9, kSizeFieldBytes));
    fields.blockCount = static_cast<uint32_t>(readBigEndian(block.data() + 12, kSizeFieldBytes));

    Log(DEBUG, "Framing", "Raw header bytes: {}", hexBytes(block.data(), block.size()));
    Log(DEBUG, "Framing", "Header name '{}', extension '{}', size {}, data blocks {}",
        fields.namePrefix, fields.extension, fields.fileSize, fields.blockCount);
    return fields;
}

Block buildFooter(const std::string& baseName, const std::string& extension,
                  const std::vector<uint8_t>& trimmedData) {
    Block footer{};
    std::string suffix = baseName.size() > kNameFieldBytes
                             ? baseName.substr(baseName.size() - kNameFieldBytes)
                             : baseName;
    writeTextField(footer.data(), suffix, kNameFieldBytes);
    writeTextField(footer.data() + kNameFieldBytes, extension, kExtensionFieldBytes);
    writeBigEndian(footer.data() + 9, checksum(trimmedData), kChecksumFieldBytes);
    return footer;
}

FooterFields parseFooter(const Block& block) {
    FooterFields fields;
    fields.nameSuffix = decodeTextField(block.data(), kNameFieldBytes);
    fields.extension = decodeTextField(block.data() + kNameFieldBytes, kExtensionFieldBytes);
    fields.checksum = readBigEndian(block.data() + 9, kChecksumFieldBytes);

    Log(DEBUG, "Framing", "Raw footer bytes: {}", hexBytes(block.data(), block.size()));
    return fields;
}

bool verifyFooter(const Block& block, const std::vector<uint8_t>& trimmedData,
                  const HeaderFields& header, FooterFields* stored) {
    FooterFields footer = parseFooter(block);
    const uint64_t computed = checksum(trimmedData);

    Log(DEBUG, "Framing", "Footer name '{}', extension '{}'", footer.nameSuffix, footer.extension);
    Log(DEBUG, "Framing", "Stored checksum {}, calculated checksum {}", footer.checksum, computed);

    // A prefix shorter than the field is the whole base name, so the suffix must match it
    if (header.namePrefix.size() < kNameFieldBytes && footer.nameSuffix != header.namePrefix) {
        Log(WARNING, "Framing", "Footer name '{}' does not match header name '{}'",
            footer.nameSuffix, header.namePrefix);
    }
    if (footer.extension != header.extension) {
        Log(WARNING, "Framing", "Footer extension '{}' does not match header extension '{}'",
            footer.extension, header.extension);
    }

    bool matches = footer.checksum == computed;
    if (stored) {
        *stored = std::move(footer);
    }
    return matches;
}

} // namespace ByteBlock
