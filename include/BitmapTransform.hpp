#pragma once
#include "Bitmap.hpp"

// Clockwise rotation in degrees (0, 90, 180, 270) for an EXIF orientation.
// Mirroring orientations map to their rotation component only.
int rotation_for_orientation(int orientation) noexcept;

// Renders src into a new canvas rotated clockwise by degrees about its centre.
// 90 and 270 swap width and height. Throws std::invalid_argument for other angles.
BitmapPtr render_rotated(const Bitmap& src, int degrees);

// 4-byte formats become their 3-byte counterpart (RGBA->RGB, BGRA->BGR).
// Other formats are returned unchanged.
BitmapPtr strip_alpha(const BitmapPtr& src);
