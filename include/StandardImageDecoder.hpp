#pragma once
#include <cstdint>
#include <vector>
#include "FormatDecoder.hpp"

// JPEG (libjpeg) and PNG (libpng) to RGBA8888.
class StandardImageDecoder : public ImageDecoder {
public:
    BitmapPtr decode(const ImageFile& file) override;

    // Exposed for tests and the CLI; both throw std::runtime_error on failure.
    static BitmapPtr decode_jpeg(const std::vector<uint8_t>& data);
    static BitmapPtr decode_png(const std::vector<uint8_t>& data);
};
