#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>
#include <sqlite3.h>
#include "ImageFile.hpp"
#include "MetadataIndex.hpp"
#include "MetadataProvider.hpp"
#include "TestSupport.hpp"

using namespace testing_support;

namespace {

// Image bytes in a real file under /tmp, so stat() identity applies.
class TempImage {
public:
    explicit TempImage(const std::vector<uint8_t>& bytes) {
        char tmpl[] = "/tmp/pixcache_meta_XXXXXX";
        const int fd = ::mkstemp(tmpl);
        if (fd < 0) throw std::runtime_error("mkstemp failed");
        ::close(fd);
        path_ = tmpl;
        write(bytes);
    }
    ~TempImage() { std::remove(path_.c_str()); }

    void write(const std::vector<uint8_t>& bytes) {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// In-memory SQLite with the metadata schema.
class MemoryDb {
public:
    MemoryDb() {
        if (sqlite3_open(":memory:", &db_) != SQLITE_OK) throw std::runtime_error("sqlite open failed");
        std::string err;
        if (!MetadataIndex::ensure_schema(db_, err)) throw std::runtime_error(err);
    }
    ~MemoryDb() { sqlite3_close(db_); }
    sqlite3* get() const { return db_; }

private:
    sqlite3* db_{nullptr};
};

std::vector<uint8_t> rgba_pixels(int w, int h) {
    std::vector<uint8_t> px(static_cast<size_t>(w) * h * 4);
    for (size_t i = 0; i < px.size(); ++i) px[i] = static_cast<uint8_t>(i * 7);
    return px;
}

} // namespace

// ============================================================================
// TIFF / EXIF PARSING
// ============================================================================

TEST(ExifParseTest, LittleEndianOrientation) {
    const uint8_t tiff[] = {
        'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00,
        0x01, 0x00,
        0x12, 0x01, 0x03, 0x00, 0x01, 0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00
    };
    EXPECT_EQ(parse_tiff_orientation(tiff, sizeof(tiff)), 8);
}

TEST(ExifParseTest, BigEndianViaApp1) {
    const std::vector<uint8_t> app1 = exif_app1(6);
    EXPECT_EQ(parse_exif_orientation(app1.data(), app1.size()), 6);
    EXPECT_EQ(parse_tiff_orientation(app1.data() + 6, app1.size() - 6), 6);
}

/** @brief Malformed or out-of-range data yields orientation 1 */
TEST(ExifParseTest, MalformedInputDefaultsToOne) {
    std::vector<uint8_t> app1 = exif_app1(9);
    EXPECT_EQ(parse_exif_orientation(app1.data(), app1.size()), 1);

    app1 = exif_app1(6);
    app1[6 + 8 + 2 + 3] = 0x04;   // type LONG instead of SHORT
    EXPECT_EQ(parse_exif_orientation(app1.data(), app1.size()), 1);

    app1 = exif_app1(6);
    EXPECT_EQ(parse_exif_orientation(app1.data(), 18), 1);   // entry cut off

    app1 = exif_app1(6);
    app1[0] = 'X';
    EXPECT_EQ(parse_exif_orientation(app1.data(), app1.size()), 1);

    const uint8_t bad_magic[] = { 'M', 'M', 0x00, 0x2B, 0x00, 0x00, 0x00, 0x08 };
    EXPECT_EQ(parse_tiff_orientation(bad_magic, sizeof(bad_magic)), 1);
    EXPECT_EQ(parse_tiff_orientation(nullptr, 100), 1);
}

// ============================================================================
// HEADER PROVIDER
// ============================================================================

/** @brief JPEG dimensions and APP1 orientation come from one header read */
TEST(ExifMetadataProviderTest, JpegWithExif) {
    ExifMetadataProvider provider;
    MemoryImageFile file("/img/rotated.jpg", encode_jpeg(16, 8, 6));

    const HeaderInfo info = provider.read_header(file);
    EXPECT_EQ(info.orientation, 6);
    ASSERT_TRUE(info.dimensions.has_value());
    EXPECT_EQ(info.dimensions->width, 16);
    EXPECT_EQ(info.dimensions->height, 8);
    EXPECT_EQ(provider.get_orientation(file), 6);
}

TEST(ExifMetadataProviderTest, JpegWithoutExif) {
    ExifMetadataProvider provider;
    MemoryImageFile file("/img/plain.jpg", encode_jpeg(12, 20));
    EXPECT_EQ(provider.get_orientation(file), 1);
    auto dims = provider.get_dimensions(file);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(dims->width, 12);
    EXPECT_EQ(dims->height, 20);
}

TEST(ExifMetadataProviderTest, PngDimensions) {
    ExifMetadataProvider provider;
    MemoryImageFile file("/img/plain.png", encode_png(7, 5, PNG_COLOR_TYPE_RGBA, rgba_pixels(7, 5)));
    EXPECT_EQ(provider.get_orientation(file), 1);
    auto dims = provider.get_dimensions(file);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(dims->width, 7);
    EXPECT_EQ(dims->height, 5);
}

TEST(ExifMetadataProviderTest, UnknownFormat) {
    ExifMetadataProvider provider;
    MemoryImageFile file("/img/notes.txt", { 'h', 'e', 'l', 'l', 'o' });
    EXPECT_EQ(provider.get_orientation(file), 1);
    EXPECT_FALSE(provider.get_dimensions(file).has_value());
}

TEST(ExifMetadataProviderTest, MissingFileThrows) {
    ExifMetadataProvider provider;
    LocalImageFile missing("/nonexistent/dir/photo.jpg");
    EXPECT_THROW(provider.get_orientation(missing), std::runtime_error);
}

// ============================================================================
// METADATA INDEX
// ============================================================================

/** @brief Repeat lookups are served from memory, then from SQLite for a fresh index */
TEST(MetadataIndexTest, ServesRepeatsFromCache) {
    TempImage img(encode_jpeg(16, 8, 6));
    LocalImageFile file(img.path());
    ExifMetadataProvider exif;
    MemoryDb db;

    MetadataIndex index(exif, db.get());
    EXPECT_EQ(index.get_orientation(file), 6);
    auto dims = index.get_dimensions(file);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(dims->width, 16);
    EXPECT_EQ(index.source_reads(), 1u);
    EXPECT_EQ(index.memory_rows(), 1u);

    MetadataIndex cold(exif, db.get());
    EXPECT_EQ(cold.get_orientation(file), 6);
    EXPECT_EQ(cold.get_dimensions(file)->height, 8);
    EXPECT_EQ(cold.source_reads(), 0u);
}

/** @brief Rewriting the file invalidates both tiers */
TEST(MetadataIndexTest, RewrittenFileIsReread) {
    const std::vector<uint8_t> first = encode_jpeg(16, 8, 6);
    std::vector<uint8_t> second = encode_jpeg(40, 24, 3);
    if (second.size() == first.size()) second.push_back(0);

    TempImage img(first);
    LocalImageFile file(img.path());
    ExifMetadataProvider exif;
    MemoryDb db;
    MetadataIndex index(exif, db.get());

    EXPECT_EQ(index.get_orientation(file), 6);
    img.write(second);
    EXPECT_EQ(index.get_orientation(file), 3);
    EXPECT_EQ(index.get_dimensions(file)->width, 40);
    EXPECT_EQ(index.source_reads(), 2u);

    MetadataIndex cold(exif, db.get());
    EXPECT_EQ(cold.get_orientation(file), 3);
    EXPECT_EQ(cold.source_reads(), 0u);
}

TEST(MetadataIndexTest, WorksWithoutDatabase) {
    TempImage img(encode_jpeg(16, 8, 8));
    LocalImageFile file(img.path());
    ExifMetadataProvider exif;

    MetadataIndex index(exif, nullptr);
    EXPECT_EQ(index.get_orientation(file), 8);
    EXPECT_EQ(index.get_orientation(file), 8);
    EXPECT_EQ(index.source_reads(), 1u);
}

/** @brief Files without a local identity always go to the wrapped provider */
TEST(MetadataIndexTest, NonLocalFilesBypassCache) {
    FakeMetadata source;
    source.set_orientation("/virtual/a.jpg", 5);
    source.set_dimensions("/virtual/a.jpg", 0, 0);
    MetadataIndex index(source, nullptr);
    MemoryImageFile file("/virtual/a.jpg");

    EXPECT_EQ(index.get_orientation(file), 5);
    EXPECT_EQ(index.get_orientation(file), 5);
    EXPECT_FALSE(index.get_dimensions(file).has_value());
    EXPECT_EQ(index.source_reads(), 3u);
    EXPECT_EQ(index.memory_rows(), 0u);
}

TEST(MetadataIndexTest, EnsureSchemaRejectsNullHandle) {
    std::string err;
    EXPECT_FALSE(MetadataIndex::ensure_schema(nullptr, err));
    EXPECT_FALSE(err.empty());
}
