#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ByteBlock {

// A file's bytes together with the name they travel under on a page
struct RawFile {
    std::string baseName;
    std::string extension;
    std::vector<uint8_t> data;

    // "<baseName>.<extension>", or just baseName without an extension
    std::string fileName() const;
};

class FileStore {
public:
    /**
     * @brief Read a whole file; the name is split into base name and extension
     * @throws IOError when the file cannot be opened or read
     */
    static RawFile readRawFile(const std::string& path);

    /**
     * @brief Write file.fileName() into directory, creating the directory when needed
     *
     * Data goes to a temporary sibling first and is renamed over any existing file, so a
     * failed write never leaves a partial result.
     * @return Path of the written file
     * @throws IOError on any filesystem failure
     */
    static std::string writeRawFile(const RawFile& file, const std::string& directory);
};

} // namespace ByteBlock
