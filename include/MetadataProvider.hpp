#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include "ImageFile.hpp"

struct ImageDimensions {
    int width{0};
    int height{0};
};

// Source of orientation and pixel dimensions without a full decode.
// Implementations may throw; callers degrade to defaults.
class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;
    virtual int get_orientation(const ImageFile& file) = 0;   // 1..8, EXIF convention
    virtual std::optional<ImageDimensions> get_dimensions(const ImageFile& file) = 0;
};

struct HeaderInfo {
    int orientation{1};
    std::optional<ImageDimensions> dimensions;
};

// Reads JPEG (libjpeg, APP1 Exif) and PNG (libpng, IHDR / eXIf) headers.
class ExifMetadataProvider : public MetadataProvider {
public:
    explicit ExifMetadataProvider(int log_fd = -1) : log_fd_(log_fd) {}

    int get_orientation(const ImageFile& file) override;
    std::optional<ImageDimensions> get_dimensions(const ImageFile& file) override;

    // Both values from one header read.
    HeaderInfo read_header(const ImageFile& file);

private:
    int log_fd_{-1};
};

// Orientation tag (0x0112) of IFD0 in a TIFF block. 1 when absent or malformed.
int parse_tiff_orientation(const uint8_t* tiff, size_t size) noexcept;

// Same, for an APP1 payload starting with "Exif\0\0".
int parse_exif_orientation(const uint8_t* app1, size_t size) noexcept;
