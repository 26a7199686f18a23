#include "DecodePipeline.hpp"
#include "BitmapTransform.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <stdexcept>


DecodePipeline::DecodePipeline(ImageDecoder& standard,
                               FormatDecoder& alternate,
                               MetadataProvider& metadata,
                               std::vector<std::string> alternate_extensions,
                               int log_fd,
                               int max_concurrent)
    : standard_(standard),
      alternate_(alternate),
      metadata_(metadata),
      log_fd_(log_fd),
      slots_(max_concurrent) {
    for (auto& ext : alternate_extensions) {
        std::string e = lower_extension("x" + (ext.empty() || ext[0] == '.' ? ext : "." + ext));
        if (!e.empty()) alternate_exts_.push_back(e);
    }
}

std::vector<std::string> DecodePipeline::default_alternate_extensions() {
    return { ".heif", ".heic", ".avif", ".hif" };
}

bool DecodePipeline::is_alternate_format(const std::string& path) const {
    const std::string ext = lower_extension(path);
    return !ext.empty() &&
           std::find(alternate_exts_.begin(), alternate_exts_.end(), ext) != alternate_exts_.end();
}


// Desc: route to the alternate or the standard decoder
// In: const ImageFile& file
// Out: BitmapPtr (nullptr when the alternate decoder is unavailable); may throw
BitmapPtr DecodePipeline::decode_raw(const ImageFile& file) {
    SemaphoreSlot slot(slots_);
    if (is_alternate_format(file.path())) {
        if (!alternate_.is_supported()) {
            log_line(log_fd_, "Decode", "no decoder installed for " + file.path());
            return nullptr;
        }
        return alternate_.decode(file);
    }
    return standard_.decode(file);
}


// Desc: orientation from metadata, 1 on any failure
// In: const ImageFile& file
// Out: int (1..8)
int DecodePipeline::read_orientation(const ImageFile& file) {
    try {
        const int o = metadata_.get_orientation(file);
        return (o >= 1 && o <= 8) ? o : 1;
    } catch (const std::exception& e) {
        #ifdef DEBUG
        log_line(log_fd_, "Decode", "orientation unavailable for " + file.path() + ": " + e.what());
        #endif
        (void)e;
        return 1;
    }
}


// Desc: decode, validate, rotate per orientation, optionally strip alpha
// In: const ImageFile& file
// Out: BitmapPtr (nullptr on failure)
BitmapPtr DecodePipeline::decode(const ImageFile& file) {
    BitmapPtr original;
    try {
        original = decode_raw(file);
    } catch (const std::exception& e) {
        log_line(log_fd_, "Decode", "failed " + file.path() + ": " + e.what());
        return nullptr;
    }
    if (!original) return nullptr;

    if (original->width() <= 0 || original->height() <= 0) {
        log_line(log_fd_, "Decode", "zero-size image " + file.path());
        return nullptr;
    }

    const int degrees = rotation_for_orientation(read_orientation(file));
    BitmapPtr result = original;
    if (degrees != 0) {
        try {
            result = render_rotated(*original, degrees);
            original.reset(); // pre-rotation buffer is no longer needed
        } catch (const std::exception& e) {
            log_line(log_fd_, "Decode", "rotation failed for " + file.path() + ": " + e.what());
            result = original;
        }
    }

    if (strip_alpha()) {
        try {
            result = ::strip_alpha(result);
        } catch (const std::exception& e) {
            log_line(log_fd_, "Decode", "alpha strip failed for " + file.path() + ": " + e.what());
        }
    }
    return result;
}


// Desc: thumbnail through the alternate decoder (alternate formats only)
// In: const ImageFile& file, int max_size
// Out: BitmapPtr (nullptr when unsupported or on failure)
BitmapPtr DecodePipeline::decode_thumbnail(const ImageFile& file, int max_size) {
    if (!is_alternate_format(file.path()) || !alternate_.is_supported()) return nullptr;
    if (max_size <= 0) max_size = kDefaultThumbnailSize;
    try {
        SemaphoreSlot slot(slots_);
        BitmapPtr thumb = alternate_.decode_thumbnail(file, max_size);
        if (thumb && (thumb->width() <= 0 || thumb->height() <= 0)) return nullptr;
        return thumb;
    } catch (const std::exception& e) {
        log_line(log_fd_, "Decode", "thumbnail failed " + file.path() + ": " + e.what());
        return nullptr;
    }
}
