#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdlib>
#include "BitmapCache.hpp"
#include "DecodePipeline.hpp"
#include "Dispatcher.hpp"
#include "MetadataIndex.hpp"
#include "MetadataProvider.hpp"
#include "StandardImageDecoder.hpp"
#include "TestSupport.hpp"
#include "Warmup.hpp"

using namespace testing_support;
namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/pixcache_dir_XXXXXX";
        if (!::mkdtemp(tmpl)) throw std::runtime_error("mkdtemp failed");
        path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    std::string put(const std::string& name, const std::vector<uint8_t>& bytes) const {
        const std::string p = path_ + "/" + name;
        std::ofstream out(p, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return p;
    }
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

// ============================================================================
// FOLDER LISTING
// ============================================================================

/** @brief Image extensions match case-insensitively; other files and directories are skipped */
TEST(WarmupTest, ListsImagesSorted) {
    TempDir dir;
    dir.put("c.png", { 1 });
    dir.put("a.JPG", { 1 });
    dir.put("b.jpeg", { 1 });
    dir.put("d.heic", { 1 });
    dir.put("notes.txt", { 1 });
    dir.put("noext", { 1 });
    fs::create_directory(dir.path() + "/sub.jpg");

    const auto with_alt = Warmup::list_image_files(dir.path(), { ".heic" });
    ASSERT_EQ(with_alt.size(), 4u);
    EXPECT_EQ(fs::path(with_alt[0]).filename().string(), "a.JPG");
    EXPECT_EQ(fs::path(with_alt[1]).filename().string(), "b.jpeg");
    EXPECT_EQ(fs::path(with_alt[2]).filename().string(), "c.png");
    EXPECT_EQ(fs::path(with_alt[3]).filename().string(), "d.heic");

    EXPECT_EQ(Warmup::list_image_files(dir.path(), {}).size(), 3u);
    EXPECT_TRUE(Warmup::list_image_files(dir.path() + "/missing", {}).empty());
}

// ============================================================================
// END TO END
// ============================================================================

/** @brief Real files through the full stack: header metadata, libjpeg/libpng decode, rotation, cache */
TEST(WarmupTest, WarmFolderThroughRealDecoders) {
    TempDir dir;
    dir.put("01.jpg", encode_jpeg(16, 8, 6));
    dir.put("02.png", encode_png(5, 3, PNG_COLOR_TYPE_GRAY, std::vector<uint8_t>(15, 200)));
    dir.put("03.jpg", { 'n', 'o', 't', ' ', 'a', ' ', 'j', 'p', 'e', 'g' });

    ExifMetadataProvider exif;
    MetadataIndex metadata(exif, nullptr);
    StandardImageDecoder standard;
    NoopFormatDecoder alternate;
    DecodePipeline pipeline(standard, alternate, metadata, DecodePipeline::default_alternate_extensions());
    ManualDispatcher ui;
    {
        BitmapCache cache(pipeline, metadata, ui, CacheLimits{ 10, 64ULL * 1024ULL * 1024ULL, 0 }, -1, 1, false);
        const auto files = Warmup::open_local_files(Warmup::list_image_files(dir.path(), {}));
        ASSERT_EQ(files.size(), 3u);

        CancellationSource src;
        EXPECT_EQ(Warmup::warm_folder(cache, files, src.token(), -1), 2u);
        cache.wait_idle();

        BitmapPtr rotated = cache.get_bitmap(*files[0]);
        ASSERT_NE(rotated, nullptr);
        EXPECT_EQ(rotated->width(), 8);
        EXPECT_EQ(rotated->height(), 16);
        EXPECT_TRUE(cache.is_in_cache(files[1]->path()));
        EXPECT_FALSE(cache.is_in_cache(files[2]->path()));
        EXPECT_EQ(cache.stats().size_bytes, 8u * 16u * 4u + 5u * 3u * 4u);

        // a second warm finds everything decodable already cached
        EXPECT_EQ(Warmup::warm_folder(cache, files, src.token(), -1), 0u);
    }
    ui.drain();
}
