#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ByteBlock {

enum class ErrorKind {
    PageOverflow,
    HeaderDecode,
    Integrity,
    IO,
    InvalidGeometry
};

const char* errorKindName(ErrorKind kind);

/**
 * @brief Base class for every error raised by the ByteBlock core
 */
class ByteBlockError : public std::runtime_error {
public:
    ByteBlockError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class PageOverflowError : public ByteBlockError {
public:
    PageOverflowError(size_t requiredBlocks, size_t capacity);

    size_t requiredBlocks() const { return requiredBlocks_; }
    size_t capacity() const { return capacity_; }

private:
    size_t requiredBlocks_;
    size_t capacity_;
};

class HeaderDecodeError : public ByteBlockError {
public:
    explicit HeaderDecodeError(const std::string& message)
        : ByteBlockError(ErrorKind::HeaderDecode, message) {}
};

class IntegrityError : public ByteBlockError {
public:
    IntegrityError(uint64_t storedChecksum, uint64_t computedChecksum,
                   const std::string& namePrefix, const std::string& extension,
                   uint32_t fileSize);

    uint64_t storedChecksum() const { return storedChecksum_; }
    uint64_t computedChecksum() const { return computedChecksum_; }
    const std::string& namePrefix() const { return namePrefix_; }
    const std::string& extension() const { return extension_; }
    uint32_t fileSize() const { return fileSize_; }

private:
    uint64_t storedChecksum_;
    uint64_t computedChecksum_;
    std::string namePrefix_;
    std::string extension_;
    uint32_t fileSize_;
};

class IOError : public ByteBlockError {
public:
    IOError(const std::string& path, const std::string& message)
        : ByteBlockError(ErrorKind::IO, message + ": " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class InvalidGeometryError : public ByteBlockError {
public:
    explicit InvalidGeometryError(const std::string& message)
        : ByteBlockError(ErrorKind::InvalidGeometry, message) {}
};

} // namespace ByteBlock
