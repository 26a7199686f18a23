#include "ImageFile.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;


// Desc: normalize a filesystem path to canonical form
// In: const std::string& path
// Out: std::string (normalized path, or input on failure)
std::string normalize_path(const std::string& path) {
    try {
        fs::path norm = fs::weakly_canonical(fs::path(path));
        std::string result = norm.string();
        if (result.size() > 1 && result.back() == '/')
            result.pop_back();
        return result;
    } catch (const fs::filesystem_error&) {
        return path;
    }
}


// Desc: build the cache key for a path (absolute + lexically normal)
// In: const std::string& path
// Out: std::string
std::string cache_key(const std::string& path) {
    if (path.empty()) return path;
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec) abs = fs::path(path);
    std::string result = abs.lexically_normal().string();
    if (result.size() > 1 && result.back() == '/')
        result.pop_back();
    return result;
}


// Desc: lowercase extension including the dot
// In: const std::string& path
// Out: std::string
std::string lower_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    for (char& c : ext) c = (char)std::tolower((unsigned char)c);
    return ext;
}


LocalImageFile::LocalImageFile(const std::string& path)
    : path_(normalize_path(path)), name_(fs::path(path_).filename().string()) {}

std::unique_ptr<std::istream> LocalImageFile::open_read() const {
    auto in = std::make_unique<std::ifstream>(path_, std::ios::binary);
    if (!in->is_open()) {
        throw std::runtime_error("cannot open " + path_);
    }
    return in;
}


// Desc: read up to max_bytes of an image file into memory
// In: const ImageFile& file, size_t max_bytes
// Out: std::vector<uint8_t>; throws std::runtime_error on open/read failure
std::vector<uint8_t> read_file_bytes(const ImageFile& file, size_t max_bytes) {
    std::unique_ptr<std::istream> in = file.open_read();
    if (!in || !*in) {
        throw std::runtime_error("cannot open " + file.path());
    }

    std::vector<uint8_t> data;
    char chunk[64 * 1024];
    while (data.size() < max_bytes && *in) {
        const size_t want = std::min(sizeof(chunk), max_bytes - data.size());
        in->read(chunk, static_cast<std::streamsize>(want));
        const std::streamsize got = in->gcount();
        if (got <= 0) break;
        data.insert(data.end(), chunk, chunk + got);
    }
    if (in->bad()) {
        throw std::runtime_error("read error on " + file.path());
    }
    return data;
}
