#include "StandardImageDecoder.hpp"
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <jpeglib.h>
#include <png.h>

namespace {

// ---------------------------
// libjpeg
// ---------------------------
struct JpegErrorMgr {
    jpeg_error_mgr pub;
    jmp_buf        jump;
    char           msg[JMSG_LENGTH_MAX];
};

void jpeg_error_exit_jump(j_common_ptr cinfo) {
    JpegErrorMgr* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    longjmp(err->jump, 1);
}

void jpeg_output_silent(j_common_ptr) {}

// Adobe writes CMYK inverted.
inline uint8_t cmyk_channel(uint8_t c, uint8_t k) {
    return static_cast<uint8_t>((static_cast<unsigned>(c) * k + 127) / 255);
}

// ---------------------------
// libpng
// ---------------------------
struct PngMemReader {
    const uint8_t* data;
    size_t size;
    size_t pos;
};

struct PngErrorState {
    char msg[256];
};

void png_read_from_memory(png_structp png, png_bytep out, png_size_t len) {
    PngMemReader* r = static_cast<PngMemReader*>(png_get_io_ptr(png));
    if (r->pos > r->size || len > r->size - r->pos) {
        png_error(png, "unexpected end of data");
    }
    std::memcpy(out, r->data + r->pos, len);
    r->pos += len;
}

void png_error_jump(png_structp png, png_const_charp message) {
    PngErrorState* st = static_cast<PngErrorState*>(png_get_error_ptr(png));
    if (st) std::snprintf(st->msg, sizeof(st->msg), "%s", message ? message : "unknown");
    png_longjmp(png, 1);
}

void png_warning_silent(png_structp, png_const_charp) {}

} // namespace


// Desc: decode a JPEG buffer into an RGBA8888 bitmap
// In: const std::vector<uint8_t>& data
// Out: BitmapPtr; throws std::runtime_error on libjpeg errors
BitmapPtr StandardImageDecoder::decode_jpeg(const std::vector<uint8_t>& data) {
    jpeg_decompress_struct cinfo;
    JpegErrorMgr jerr;
    std::memset(jerr.msg, 0, sizeof(jerr.msg));
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_jump;
    jerr.pub.output_message = jpeg_output_silent;

    std::vector<uint8_t> rgba;
    std::vector<uint8_t> scan;
    if (setjmp(jerr.jump)) {
        jpeg_destroy_decompress(&cinfo);
        throw std::runtime_error(std::string("jpeg decode failed: ") + jerr.msg);
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(data.data()), static_cast<unsigned long>(data.size()));
    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        jpeg_destroy_decompress(&cinfo);
        throw std::runtime_error("jpeg decode failed: no image header");
    }

    const bool cmyk = cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK;
    cinfo.out_color_space = cmyk ? JCS_CMYK : JCS_RGB;
    jpeg_start_decompress(&cinfo);

    const int width  = static_cast<int>(cinfo.output_width);
    const int height = static_cast<int>(cinfo.output_height);
    const int comps  = cinfo.output_components;
    const size_t stride = static_cast<size_t>(width) * 4;
    rgba.assign(stride * static_cast<size_t>(height), 0);
    scan.assign(static_cast<size_t>(width) * static_cast<size_t>(comps), 0);

    while (cinfo.output_scanline < cinfo.output_height) {
        const size_t y = cinfo.output_scanline;
        JSAMPROW rowp = scan.data();
        jpeg_read_scanlines(&cinfo, &rowp, 1);
        uint8_t* dst = rgba.data() + y * stride;
        const uint8_t* src = scan.data();
        for (int x = 0; x < width; ++x, dst += 4, src += comps) {
            if (cmyk) {
                dst[0] = cmyk_channel(src[0], src[3]);
                dst[1] = cmyk_channel(src[1], src[3]);
                dst[2] = cmyk_channel(src[2], src[3]);
            } else {
                dst[0] = src[0];
                dst[1] = src[1];
                dst[2] = src[2];
            }
            dst[3] = 0xFF;
        }
    }
    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);

    return std::make_shared<Bitmap>(width, height, PixelFormat::Rgba8888, stride, std::move(rgba));
}


// Desc: decode a PNG buffer into an RGBA8888 bitmap
// In: const std::vector<uint8_t>& data
// Out: BitmapPtr; throws std::runtime_error on libpng errors
BitmapPtr StandardImageDecoder::decode_png(const std::vector<uint8_t>& data) {
    PngErrorState err_state;
    std::memset(err_state.msg, 0, sizeof(err_state.msg));
    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, &err_state,
                                             png_error_jump, png_warning_silent);
    if (!png) throw std::runtime_error("png decode failed: out of memory");
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        throw std::runtime_error("png decode failed: out of memory");
    }

    std::vector<uint8_t> rgba;
    std::vector<png_bytep> rows;
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        throw std::runtime_error(std::string("png decode failed: ") + err_state.msg);
    }

    PngMemReader reader{ data.data(), data.size(), 0 };
    png_set_read_fn(png, &reader, png_read_from_memory);
    png_read_info(png, info);

    const png_uint_32 width  = png_get_image_width(png, info);
    const png_uint_32 height = png_get_image_height(png, info);
    const int color_type = png_get_color_type(png, info);
    const int bit_depth  = png_get_bit_depth(png, info);

    // Normalise everything to 8-bit RGBA.
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
    if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
    if (bit_depth == 16) png_set_strip_16(png);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
    if (!(color_type & PNG_COLOR_MASK_ALPHA) && !png_get_valid(png, info, PNG_INFO_tRNS)) {
        png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
    }
    png_set_interlace_handling(png);
    png_read_update_info(png, info);

    const size_t stride = static_cast<size_t>(width) * 4;
    if (png_get_rowbytes(png, info) != stride) {
        png_destroy_read_struct(&png, &info, nullptr);
        throw std::runtime_error("png decode failed: unexpected row layout");
    }
    rgba.assign(stride * static_cast<size_t>(height), 0);
    rows.resize(height);
    for (png_uint_32 y = 0; y < height; ++y) rows[y] = rgba.data() + static_cast<size_t>(y) * stride;

    png_read_image(png, rows.data());
    png_read_end(png, nullptr);
    png_destroy_read_struct(&png, &info, nullptr);

    return std::make_shared<Bitmap>(static_cast<int>(width), static_cast<int>(height),
                                    PixelFormat::Rgba8888, stride, std::move(rgba));
}


// Desc: sniff the signature and decode with the matching library
// In: const ImageFile& file
// Out: BitmapPtr; throws std::runtime_error on unknown or corrupt data
BitmapPtr StandardImageDecoder::decode(const ImageFile& file) {
    const std::vector<uint8_t> data = read_file_bytes(file);
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return decode_jpeg(data);
    }
    if (data.size() >= 8 && png_sig_cmp(data.data(), 0, 8) == 0) {
        return decode_png(data);
    }
    throw std::runtime_error("unsupported image format: " + file.path());
}
