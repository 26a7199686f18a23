#pragma once
#include "Bitmap.hpp"
#include "ImageFile.hpp"

// Full decode of a file into a bitmap. Throws on corrupt or unsupported input.
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;
    virtual BitmapPtr decode(const ImageFile& file) = 0;
};

// Pluggable decoder for alternate formats (HEIF/HEIC/AVIF).
// Callers check is_supported() before routing files to it.
class FormatDecoder {
public:
    virtual ~FormatDecoder() = default;
    virtual bool is_supported() const = 0;
    virtual BitmapPtr decode(const ImageFile& file) = 0;
    virtual BitmapPtr decode_thumbnail(const ImageFile& file, int max_size) = 0;
};

// Installed when no alternate-format codec is available.
class NoopFormatDecoder : public FormatDecoder {
public:
    bool is_supported() const override { return false; }
    BitmapPtr decode(const ImageFile&) override { return nullptr; }
    BitmapPtr decode_thumbnail(const ImageFile&, int) override { return nullptr; }
};
