#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

enum class PixelFormat : uint8_t {
    Rgba8888 = 0,
    Bgra8888 = 1,
    Rgb888   = 2,
    Bgr888   = 3,
    Gray8    = 4
};

int bytes_per_pixel(PixelFormat fmt) noexcept;

// Decoded pixel buffer. Rows are `stride` bytes apart; stride >= width * bpp.
class Bitmap {
public:
    Bitmap(int width, int height, PixelFormat format);
    Bitmap(int width, int height, PixelFormat format, size_t stride, std::vector<uint8_t> pixels);
    ~Bitmap();

    Bitmap(const Bitmap&) = delete;
    Bitmap& operator=(const Bitmap&) = delete;

    int         width()  const { return width_; }
    int         height() const { return height_; }
    PixelFormat format() const { return format_; }
    size_t      stride() const { return stride_; }

    uint8_t*       row(int y)       { return pixels_.data() + static_cast<size_t>(y) * stride_; }
    const uint8_t* row(int y) const { return pixels_.data() + static_cast<size_t>(y) * stride_; }

    // Memory footprint used for cache accounting: width * height * bpp.
    uint64_t byte_size() const noexcept;

    // Runs once, when the last owner drops the bitmap.
    void set_release_hook(std::function<void()> hook) { release_hook_ = std::move(hook); }

private:
    int width_{0};
    int height_{0};
    PixelFormat format_{PixelFormat::Rgba8888};
    size_t stride_{0};
    std::vector<uint8_t> pixels_;
    std::function<void()> release_hook_;
};

using BitmapPtr = std::shared_ptr<Bitmap>;
