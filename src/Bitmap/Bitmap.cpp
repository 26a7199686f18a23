#include "Bitmap.hpp"
#include <stdexcept>


// Desc: bytes used by one pixel of the given format
// In: PixelFormat fmt
// Out: int
int bytes_per_pixel(PixelFormat fmt) noexcept {
    switch (fmt) {
        case PixelFormat::Rgba8888:
        case PixelFormat::Bgra8888: return 4;
        case PixelFormat::Rgb888:
        case PixelFormat::Bgr888:   return 3;
        case PixelFormat::Gray8:    return 1;
    }
    return 4;
}

Bitmap::Bitmap(int width, int height, PixelFormat format)
    : width_(width), height_(height), format_(format) {
    const size_t w = width > 0 ? static_cast<size_t>(width) : 0;
    const size_t h = height > 0 ? static_cast<size_t>(height) : 0;
    stride_ = w * static_cast<size_t>(bytes_per_pixel(format));
    pixels_.assign(stride_ * h, 0);
}

Bitmap::Bitmap(int width, int height, PixelFormat format, size_t stride, std::vector<uint8_t> pixels)
    : width_(width), height_(height), format_(format), stride_(stride), pixels_(std::move(pixels)) {
    const size_t w = width > 0 ? static_cast<size_t>(width) : 0;
    const size_t h = height > 0 ? static_cast<size_t>(height) : 0;
    if (stride_ < w * static_cast<size_t>(bytes_per_pixel(format)) || pixels_.size() < stride_ * h) {
        throw std::invalid_argument("bitmap buffer smaller than width/height/stride");
    }
}

Bitmap::~Bitmap() {
    if (release_hook_) {
        try { release_hook_(); } catch (const std::exception&) { /* destructor must not throw */ }
    }
}

uint64_t Bitmap::byte_size() const noexcept {
    if (width_ <= 0 || height_ <= 0) return 0;
    return static_cast<uint64_t>(width_) * static_cast<uint64_t>(height_) *
           static_cast<uint64_t>(bytes_per_pixel(format_));
}
