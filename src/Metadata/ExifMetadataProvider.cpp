#include "MetadataProvider.hpp"
#include "Logger.hpp"
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <jpeglib.h>
#include <png.h>

// Headers (Exif, ICC, XMP) live at the front; the pixel data is never needed here.
static const size_t kHeaderReadBytes = 1024 * 1024;

namespace {

inline bool in_range(size_t off, size_t len, size_t size) noexcept {
    return off <= size && len <= size - off;
}

inline uint16_t read_u16(const uint8_t* p, bool little) noexcept {
    return little ? static_cast<uint16_t>(p[0] | (p[1] << 8))
                  : static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t read_u32(const uint8_t* p, bool little) noexcept {
    return little ? (static_cast<uint32_t>(p[0])       | (static_cast<uint32_t>(p[1]) << 8) |
                     (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24))
                  : ((static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                     (static_cast<uint32_t>(p[2]) << 8)  |  static_cast<uint32_t>(p[3]));
}

inline int clamp_orientation(int v) noexcept {
    return (v >= 1 && v <= 8) ? v : 1;
}

bool is_jpeg(const std::vector<uint8_t>& d) {
    return d.size() >= 3 && d[0] == 0xFF && d[1] == 0xD8 && d[2] == 0xFF;
}

bool is_png(const std::vector<uint8_t>& d) {
    return d.size() >= 8 && png_sig_cmp(d.data(), 0, 8) == 0;
}

// ---------------------------
// libjpeg header read
// ---------------------------
struct JpegErrorMgr {
    jpeg_error_mgr pub;
    jmp_buf        jump;
};

void jpeg_error_exit_jump(j_common_ptr cinfo) {
    JpegErrorMgr* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    longjmp(err->jump, 1);
}

void jpeg_output_silent(j_common_ptr) {}

bool read_jpeg_header(const std::vector<uint8_t>& data, HeaderInfo* out) {
    jpeg_decompress_struct cinfo;
    JpegErrorMgr jerr;
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_jump;
    jerr.pub.output_message = jpeg_output_silent;
    if (setjmp(jerr.jump)) {
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(data.data()), static_cast<unsigned long>(data.size()));
    jpeg_save_markers(&cinfo, JPEG_APP0 + 1, 0xFFFF);
    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    out->dimensions = ImageDimensions{ static_cast<int>(cinfo.image_width),
                                       static_cast<int>(cinfo.image_height) };
    for (jpeg_saved_marker_ptr m = cinfo.marker_list; m != nullptr; m = m->next) {
        if (m->marker == JPEG_APP0 + 1 && m->data_length >= 14 &&
            std::memcmp(m->data, "Exif\0\0", 6) == 0) {
            out->orientation = parse_exif_orientation(m->data, m->data_length);
            break;
        }
    }
    jpeg_destroy_decompress(&cinfo);
    return true;
}

// ---------------------------
// libpng header read
// ---------------------------
struct PngMemReader {
    const uint8_t* data;
    size_t size;
    size_t pos;
};

void png_read_from_memory(png_structp png, png_bytep out, png_size_t len) {
    PngMemReader* r = static_cast<PngMemReader*>(png_get_io_ptr(png));
    if (!in_range(r->pos, len, r->size)) {
        png_error(png, "read past end of header buffer");
    }
    std::memcpy(out, r->data + r->pos, len);
    r->pos += len;
}

void png_error_jump(png_structp png, png_const_charp) {
    png_longjmp(png, 1);
}

void png_warning_silent(png_structp, png_const_charp) {}

bool read_png_header(const std::vector<uint8_t>& data, HeaderInfo* out) {
    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr,
                                             png_error_jump, png_warning_silent);
    if (!png) return false;
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        return false;
    }
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        return false;
    }

    PngMemReader reader{ data.data(), data.size(), 0 };
    png_set_read_fn(png, &reader, png_read_from_memory);
    png_read_info(png, info);

    out->dimensions = ImageDimensions{ static_cast<int>(png_get_image_width(png, info)),
                                       static_cast<int>(png_get_image_height(png, info)) };
#ifdef PNG_eXIf_SUPPORTED
    png_uint_32 exif_len = 0;
    png_bytep exif = nullptr;
    if (png_get_eXIf_1(png, info, &exif_len, &exif) != 0 && exif) {
        out->orientation = parse_tiff_orientation(exif, exif_len);
    }
#endif
    png_destroy_read_struct(&png, &info, nullptr);
    return true;
}

} // namespace


// Desc: orientation tag of IFD0 in a TIFF structure
// In: const uint8_t* tiff, size_t size
// Out: int (1..8, 1 when absent or malformed)
int parse_tiff_orientation(const uint8_t* tiff, size_t size) noexcept {
    if (!tiff || size < 8) return 1;

    bool little;
    if (tiff[0] == 'I' && tiff[1] == 'I') little = true;
    else if (tiff[0] == 'M' && tiff[1] == 'M') little = false;
    else return 1;

    if (read_u16(tiff + 2, little) != 42) return 1;

    const uint32_t ifd0 = read_u32(tiff + 4, little);
    if (ifd0 == 0 || !in_range(ifd0, 2, size)) return 1;

    const uint16_t count = read_u16(tiff + ifd0, little);
    const size_t entries = static_cast<size_t>(ifd0) + 2;
    for (uint16_t i = 0; i < count; ++i) {
        const size_t off = entries + static_cast<size_t>(i) * 12u;
        if (!in_range(off, 12, size)) break;
        const uint16_t tag  = read_u16(tiff + off, little);
        const uint16_t type = read_u16(tiff + off + 2, little);
        const uint32_t cnt  = read_u32(tiff + off + 4, little);
        if (tag != 0x0112) continue;
        if (type != 3 || cnt < 1) return 1; // SHORT expected
        return clamp_orientation(read_u16(tiff + off + 8, little));
    }
    return 1;
}


// Desc: orientation from an APP1 payload ("Exif\0\0" + TIFF)
// In: const uint8_t* app1, size_t size
// Out: int (1..8)
int parse_exif_orientation(const uint8_t* app1, size_t size) noexcept {
    if (!app1 || size < 14 || std::memcmp(app1, "Exif\0\0", 6) != 0) return 1;
    return parse_tiff_orientation(app1 + 6, size - 6);
}


// Desc: read orientation and dimensions from the file header
// In: const ImageFile& file
// Out: HeaderInfo (orientation 1 / no dimensions for unknown formats)
HeaderInfo ExifMetadataProvider::read_header(const ImageFile& file) {
    HeaderInfo info;
    const std::vector<uint8_t> head = read_file_bytes(file, kHeaderReadBytes);

    bool ok = false;
    if (is_jpeg(head)) ok = read_jpeg_header(head, &info);
    else if (is_png(head)) ok = read_png_header(head, &info);

    if (!ok) {
        #ifdef DEBUG
        log_line(log_fd_, "Metadata", "no readable header: " + file.path());
        #endif
        return HeaderInfo{};
    }
    if (info.dimensions && (info.dimensions->width <= 0 || info.dimensions->height <= 0)) {
        info.dimensions.reset();
    }
    return info;
}

int ExifMetadataProvider::get_orientation(const ImageFile& file) {
    return read_header(file).orientation;
}

std::optional<ImageDimensions> ExifMetadataProvider::get_dimensions(const ImageFile& file) {
    return read_header(file).dimensions;
}
