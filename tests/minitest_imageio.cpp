// Image codecs and file round trips through the filesystem

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <png.h>

#include "core/Errors.h"
#include "core/Logging/Logging.h"
#include "minitest.h"
#include "plugins/ImageCodec.h"
#include "plugins/PNG/PNG.h"
#include "services/PageService/FileStore.h"
#include "services/PageService/PageDecoder.h"
#include "services/PageService/PageEncoder.h"

using namespace ByteBlock;
namespace fs = std::filesystem;

static const fs::path& scratch() {
    static const fs::path dir = Test::scratchDir("imageio");
    return dir;
}

static void write_bytes(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

static std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static std::vector<uint8_t> random_bytes(size_t size, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<uint8_t> data(size);
    for (auto& b : data) b = static_cast<uint8_t>(dist(rng));
    return data;
}

// pHYs x density in pixels per metre, 0 when absent
static png_uint_32 read_phys(const fs::path& path) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) return 0;
    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info_ptr = png_create_info_struct(png_ptr);
    png_uint_32 x = 0, y = 0;
    int unit = 0;
    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        fclose(file);
        return 0;
    }
    png_init_io(png_ptr, file);
    png_read_info(png_ptr, info_ptr);
    png_uint_32 density = 0;
    if (png_get_pHYs(png_ptr, info_ptr, &x, &y, &unit) && unit == PNG_RESOLUTION_METER && x == y) {
        density = x;
    }
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
    fclose(file);
    return density;
}

static bool test_png_exact_round_trip() {
    cv::Mat image(37, 53, CV_8UC3);
    cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(256));
    const fs::path path = scratch() / "exact.png";

    ImageWriteOptions options;
    options.dpi = 2550;
    ImageCodecRegistry::getInstance().save(path.string(), image, options);
    cv::Mat loaded = ImageCodecRegistry::getInstance().load(path.string());
    T_ASSERT(loaded.type() == CV_8UC3);
    T_ASSERT(cv::countNonZero(loaded.reshape(1) != image.reshape(1)) == 0);

    T_ASSERT(PNG::dpiToPixelsPerMeter(2550) == 100394);
    T_ASSERT(read_phys(path) == 100394);

    options.dpi = 0;
    options.compressionLevel = 0;
    ImageCodecRegistry::getInstance().save(path.string(), image, options);
    T_ASSERT(read_phys(path) == 0);
    return true;
}

static bool test_codec_selection() {
    auto& registry = ImageCodecRegistry::getInstance();
    T_ASSERT(registry.getCodecNames().size() >= 2);
    T_ASSERT(registry.getCodecNames().front() == "PNG");
    T_ASSERT(registry.codecForWriting("page.png").getCodecName() == "PNG");
    T_ASSERT(registry.codecForWriting("PAGE.PNG").getCodecName() == "PNG");
    T_ASSERT(registry.codecForWriting("page.bmp").getCodecName() == "OpenCV");
    T_ASSERT(registry.isWritableExtension("png"));
    T_ASSERT(!registry.isWritableExtension(""));
    T_ASSERT(!registry.isWritableExtension("txt"));
    T_THROWS(registry.codecForWriting("page.txt"), IOError);

    // Content wins over a misleading extension
    cv::Mat image(8, 8, CV_8UC3, cv::Scalar(10, 20, 30));
    const fs::path png = scratch() / "disguised.png";
    registry.save(png.string(), image, ImageWriteOptions{});
    const fs::path disguised = scratch() / "disguised.dat";
    fs::copy_file(png, disguised, fs::copy_options::overwrite_existing);
    T_ASSERT(registry.codecForReading(disguised.string()).getCodecName() == "PNG");
    T_ASSERT(registry.load(disguised.string()).at<cv::Vec3b>(3, 3) == cv::Vec3b(10, 20, 30));
    return true;
}

static bool test_unreadable_images() {
    auto& registry = ImageCodecRegistry::getInstance();
    T_THROWS(registry.load((scratch() / "missing.png").string()), IOError);

    const fs::path text = scratch() / "notes.png";
    write_bytes(text, {'h', 'e', 'l', 'l', 'o'});
    T_THROWS(registry.load(text.string()), IOError);
    return true;
}

// Rows past the cut are left black; the rows before it decode normally
static bool test_truncated_png() {
    Geometry g(Test::smallPageSpec());
    PageEncoder encoder(g);
    RawFile file{"cut", "bin", random_bytes(40, 21)};
    cv::Mat page = encoder.render(file);

    const fs::path path = scratch() / "truncated.png";
    ImageWriteOptions options;
    options.compressionLevel = 0; // stored deflate blocks: file offset grows linearly with row
    ImageCodecRegistry::getInstance().save(path.string(), page, options);
    fs::resize_file(path, fs::file_size(path) / 2);

    cv::Mat loaded = ImageCodecRegistry::getInstance().load(path.string());
    T_ASSERT(loaded.cols == page.cols && loaded.rows == page.rows);
    T_ASSERT(loaded.at<cv::Vec3b>(loaded.rows - 1, loaded.cols - 1) == cv::Vec3b(0, 0, 0));
    T_ASSERT(cv::countNonZero(loaded.rowRange(0, 200).reshape(1) != page.rowRange(0, 200).reshape(1)) == 0);

    // All blocks sit in the first row of the grid, well before the cut
    PageDecoder decoder(g);
    T_ASSERT(decoder.decode(loaded).file.data == file.data);
    return true;
}

static bool test_encode_decode_files() {
    Geometry g(Test::smallPageSpec());
    PageEncoder encoder(g);
    PageDecoder decoder(g, 3);

    const fs::path input = scratch() / "report.pdf";
    const std::vector<uint8_t> data = random_bytes(1000, 42);
    write_bytes(input, data);

    EncodeOptions options;
    options.write.dpi = g.dpi();

    // Directory output
    const fs::path outDir = scratch() / "pages";
    fs::create_directories(outDir);
    const std::string image = encoder.encodeFile(input.string(), outDir.string(), options);
    T_ASSERT(fs::path(image) == outDir / "report_encoded.png");
    T_ASSERT(fs::exists(image));
    T_ASSERT(read_phys(image) == PNG::dpiToPixelsPerMeter(127));

    // Output without an image extension gets one
    const std::string named = encoder.encodeFile(input.string(), (scratch() / "named").string(), options);
    T_ASSERT(named == (scratch() / "named.png").string());

    // Lossless formats through OpenCV decode as well
    const std::string bmp = encoder.encodeFile(input.string(), (scratch() / "page.bmp").string(), options);
    T_ASSERT(decoder.decode(ImageCodecRegistry::getInstance().load(bmp)).file.data == data);

    const fs::path restoreDir = scratch() / "restored" / "nested";
    const std::string restored = decoder.decodeFile(image, restoreDir.string());
    T_ASSERT(fs::path(restored) == restoreDir / "repor.pdf");
    T_ASSERT(read_bytes(restored) == data);

    // Decoding again overwrites
    T_ASSERT(decoder.decodeFile(named, restoreDir.string()) == restored);
    T_ASSERT(read_bytes(restored) == data);
    return true;
}

static bool test_overflow_writes_nothing() {
    Geometry g(Test::smallPageSpec());
    PageEncoder encoder(g);
    const fs::path input = scratch() / "big.bin";
    write_bytes(input, random_bytes(2000, 5));
    const fs::path output = scratch() / "big_page.png";
    T_THROWS(encoder.encodeFile(input.string(), output.string(), EncodeOptions{}), PageOverflowError);
    T_ASSERT(!fs::exists(output));
    T_THROWS(encoder.encodeFile((scratch() / "absent.bin").string(), output.string(), EncodeOptions{}), IOError);
    return true;
}

static bool test_corrupt_page_writes_nothing() {
    Geometry g(Test::smallPageSpec());
    PageEncoder encoder(g);
    PageDecoder decoder(g);
    RawFile file{"bad", "bin", random_bytes(90, 6)};
    cv::Mat page = encoder.render(file);
    const cv::Point origin = PageLayout(g).placements(2)[1];
    cv::rectangle(page, g.sampleRect(Region::Inner) + origin, cv::Scalar(1, 2, 3), cv::FILLED);

    const fs::path path = scratch() / "corrupt.png";
    ImageCodecRegistry::getInstance().save(path.string(), page, ImageWriteOptions{});
    const fs::path outDir = scratch() / "corrupt_out";
    T_THROWS(decoder.decodeFile(path.string(), outDir.string()), IntegrityError);
    T_ASSERT(!fs::exists(outDir / "bad.bin"));
    return true;
}

static bool test_failed_save_leaves_no_file() {
    auto& registry = ImageCodecRegistry::getInstance();
    cv::Mat page(40, 30, CV_8UC3, cv::Scalar(10, 20, 30));

    // Unwritable location
    const fs::path missing = scratch() / "no_such_dir" / "page.bmp";
    T_THROWS(registry.save(missing.string(), page, ImageWriteOptions{}), IOError);
    T_ASSERT(!fs::exists(missing));
    T_ASSERT(!fs::exists(missing.parent_path() / "page.part.bmp"));

    // Encoding succeeds but the target cannot be replaced
    const fs::path blocked = scratch() / "blocked.bmp";
    fs::create_directories(blocked);
    T_THROWS(registry.save(blocked.string(), page, ImageWriteOptions{}), IOError);
    T_ASSERT(fs::is_directory(blocked));
    T_ASSERT(!fs::exists(scratch() / "blocked.part.bmp"));

    // A failed encode keeps the previous image intact
    const fs::path kept = scratch() / "kept.png";
    registry.save(kept.string(), page, ImageWriteOptions{});
    T_ASSERT(!fs::exists(scratch() / "kept.part.png"));
    const std::vector<uint8_t> before = read_bytes(kept);
    cv::Mat wide(40, 30, CV_16UC3, cv::Scalar(1, 2, 3));
    T_THROWS(registry.save(kept.string(), wide, ImageWriteOptions{}), IOError);
    T_THROWS(registry.save(kept.string(), cv::Mat(), ImageWriteOptions{}), IOError);
    T_ASSERT(read_bytes(kept) == before);
    T_ASSERT(!fs::exists(scratch() / "kept.part.png"));
    return true;
}

static bool test_file_store() {
    const fs::path dir = scratch() / "store";
    RawFile file{"a", "txt", {'x', 'y'}};
    const std::string written = FileStore::writeRawFile(file, dir.string());
    T_ASSERT(fs::path(written) == dir / "a.txt");
    T_ASSERT(!fs::exists(dir / "a.txt.part"));

    RawFile noExt{"README", "", {'z'}};
    T_ASSERT(fs::path(FileStore::writeRawFile(noExt, dir.string())) == dir / "README");

    // Separators recovered from a page never escape the output directory
    RawFile sneaky{"../x", "sh", {'!'}};
    const std::string contained = FileStore::writeRawFile(sneaky, dir.string());
    T_ASSERT(fs::path(contained).parent_path() == dir);

    RawFile read = FileStore::readRawFile(written);
    T_ASSERT(read.baseName == "a" && read.extension == "txt");
    T_ASSERT(read.data == file.data);

    T_THROWS(FileStore::readRawFile((dir / "nothing").string()), IOError);
    T_THROWS(FileStore::readRawFile(dir.string()), IOError);
    return true;
}

int main() {
    InitializeLogging(WARNING);
    bool ok = true;
    T_RUN(ok, test_png_exact_round_trip);
    T_RUN(ok, test_codec_selection);
    T_RUN(ok, test_unreadable_images);
    T_RUN(ok, test_truncated_png);
    T_RUN(ok, test_encode_decode_files);
    T_RUN(ok, test_overflow_writes_nothing);
    T_RUN(ok, test_corrupt_page_writes_nothing);
    T_RUN(ok, test_failed_save_leaves_no_file);
    T_RUN(ok, test_file_store);
    ShutdownLogging();
    fs::remove_all(scratch());
    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
