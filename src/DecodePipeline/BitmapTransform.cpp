#include "BitmapTransform.hpp"
#include <cstring>
#include <stdexcept>
#include <string>


int rotation_for_orientation(int orientation) noexcept {
    switch (orientation) {
        case 3: case 4: return 180;
        case 6: case 7: return 90;
        case 8: case 5: return 270;
        default:        return 0;
    }
}


// Desc: rotate about the image centre (translate to origin, rotate, translate back)
// In: const Bitmap& src, int degrees (clockwise)
// Out: BitmapPtr (same pixel format as src)
BitmapPtr render_rotated(const Bitmap& src, int degrees) {
    int cos_t = 0, sin_t = 0;
    switch (degrees) {
        case 90:  cos_t =  0; sin_t =  1; break;
        case 180: cos_t = -1; sin_t =  0; break;
        case 270: cos_t =  0; sin_t = -1; break;
        default:
            throw std::invalid_argument("unsupported rotation: " + std::to_string(degrees));
    }

    const int sw = src.width();
    const int sh = src.height();
    const bool swap = (degrees != 180);
    const int dw = swap ? sh : sw;
    const int dh = swap ? sw : sh;
    const int bpp = bytes_per_pixel(src.format());

    auto dst = std::make_shared<Bitmap>(dw, dh, src.format());

    // Pixel centres in doubled coordinates keep the mapping exact in integers.
    // Destination point q maps back to source p = R(-theta) * (q - c_dst) + c_src.
    for (int dy = 0; dy < dh; ++dy) {
        uint8_t* out = dst->row(dy);
        const int qy = 2 * dy + 1 - dh;
        for (int dx = 0; dx < dw; ++dx) {
            const int qx = 2 * dx + 1 - dw;
            const int px =  qx * cos_t + qy * sin_t;
            const int py = -qx * sin_t + qy * cos_t;
            const int sx = (px + sw - 1) / 2;
            const int sy = (py + sh - 1) / 2;
            if (sx < 0 || sx >= sw || sy < 0 || sy >= sh) continue;
            std::memcpy(out + static_cast<size_t>(dx) * bpp,
                        src.row(sy) + static_cast<size_t>(sx) * bpp,
                        static_cast<size_t>(bpp));
        }
    }
    return dst;
}


// Desc: drop the alpha channel row by row, honouring the source stride
// In: const BitmapPtr& src
// Out: BitmapPtr (new 3-byte bitmap, or src itself)
BitmapPtr strip_alpha(const BitmapPtr& src) {
    if (!src) return src;
    PixelFormat target;
    switch (src->format()) {
        case PixelFormat::Rgba8888: target = PixelFormat::Rgb888; break;
        case PixelFormat::Bgra8888: target = PixelFormat::Bgr888; break;
        default: return src;
    }

    auto dst = std::make_shared<Bitmap>(src->width(), src->height(), target);
    for (int y = 0; y < src->height(); ++y) {
        const uint8_t* in = src->row(y);
        uint8_t* out = dst->row(y);
        for (int x = 0; x < src->width(); ++x, in += 4, out += 3) {
            out[0] = in[0];
            out[1] = in[1];
            out[2] = in[2];
        }
    }
    return dst;
}
