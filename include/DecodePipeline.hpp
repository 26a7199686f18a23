#pragma once
#include <atomic>
#include <string>
#include <vector>
#include "Bitmap.hpp"
#include "FormatDecoder.hpp"
#include "ImageFile.hpp"
#include "MetadataProvider.hpp"
#include "SimpleSemaphore.hpp"

// Thumbnail edge used when the caller does not pass one.
static const int kDefaultThumbnailSize = 120;

// File -> display-ready bitmap: format routing, dimension check,
// orientation correction, optional alpha stripping.
// Never throws; every failure is logged and returned as nullptr.
class DecodePipeline {
public:
    DecodePipeline(ImageDecoder& standard,
                   FormatDecoder& alternate,
                   MetadataProvider& metadata,
                   std::vector<std::string> alternate_extensions,
                   int log_fd = -1,
                   int max_concurrent = 4);

    BitmapPtr decode(const ImageFile& file);
    BitmapPtr decode_thumbnail(const ImageFile& file, int max_size = kDefaultThumbnailSize);

    bool is_alternate_format(const std::string& path) const;

    void set_strip_alpha(bool on) { strip_alpha_.store(on); }
    bool strip_alpha() const { return strip_alpha_.load(); }

    static std::vector<std::string> default_alternate_extensions();

private:
    BitmapPtr decode_raw(const ImageFile& file);
    int read_orientation(const ImageFile& file);

    ImageDecoder& standard_;
    FormatDecoder& alternate_;
    MetadataProvider& metadata_;
    std::vector<std::string> alternate_exts_;
    int log_fd_{-1};
    SimpleSemaphore slots_;
    std::atomic<bool> strip_alpha_{false};
};
