#include "FileStore.h"

#include <filesystem>
#include <fstream>
#include <tuple>

#include "core/Errors.h"
#include "core/Logging/Logging.h"
#include "core/Page/Framing.h"

namespace fs = std::filesystem;

namespace ByteBlock {

namespace {

// Decoded names come from pixels: keep them inside the output directory
std::string safeFileName(std::string name) {
    for (char& c : name) {
        if (c == '/' || c == '\\' || c == '\0') {
            c = '_';
        }
    }
    if (name == "." || name == "..") {
        name = "_" + name;
    }
    return name;
}

} // namespace

std::string RawFile::fileName() const {
    return extension.empty() ? baseName : baseName + "." + extension;
}

RawFile FileStore::readRawFile(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IOError(path, "Not a readable file");
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw IOError(path, "Cannot open file");
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        throw IOError(path, "Cannot determine file size");
    }
    file.seekg(0, std::ios::beg);

    RawFile raw;
    std::tie(raw.baseName, raw.extension) = splitFileName(path);
    raw.data.resize(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(raw.data.data()), size)) {
        throw IOError(path, "Cannot read file");
    }

    Log(DEBUG, "FileStore", "Read {} bytes from {} (name '{}', extension '{}')",
        raw.data.size(), path, raw.baseName, raw.extension);
    return raw;
}

std::string FileStore::writeRawFile(const RawFile& file, const std::string& directory) {
    if (file.baseName.empty() && file.extension.empty()) {
        throw IOError(directory, "Decoded file has no name");
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw IOError(directory, "Cannot create directory (" + ec.message() + ")");
    }

    fs::path target = fs::path(directory) / safeFileName(file.fileName());
    fs::path temp = target;
    temp += ".part";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw IOError(temp.string(), "Cannot create file");
        }
        out.write(reinterpret_cast<const char*>(file.data.data()), static_cast<std::streamsize>(file.data.size()));
        out.close();
        if (!out) {
            fs::remove(temp, ec);
            throw IOError(temp.string(), "Cannot write file");
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code removeEc;
        fs::remove(temp, removeEc);
        throw IOError(target.string(), "Cannot move file into place (" + ec.message() + ")");
    }

    Log(DEBUG, "FileStore", "Wrote {} bytes to {}", file.data.size(), target.string());
    return target.string();
}

} // namespace ByteBlock
