#pragma once
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

// Read-only handle to an image on some storage.
class ImageFile {
public:
    virtual ~ImageFile() = default;
    virtual std::unique_ptr<std::istream> open_read() const = 0;
    virtual const std::string& name() const = 0;
    virtual const std::string& path() const = 0;
};

using ImageFilePtr = std::shared_ptr<const ImageFile>;

class LocalImageFile : public ImageFile {
public:
    explicit LocalImageFile(const std::string& path);

    std::unique_ptr<std::istream> open_read() const override;
    const std::string& name() const override { return name_; }
    const std::string& path() const override { return path_; }

private:
    std::string path_;
    std::string name_;
};

// Canonical absolute form (symlinks resolved where the path exists).
std::string normalize_path(const std::string& path);

// Absolute, lexically normalised form; no filesystem access beyond the cwd.
std::string cache_key(const std::string& path);

// ".JPG" -> ".jpg"; empty when the name has no extension.
std::string lower_extension(const std::string& path);

// Reads at most max_bytes from the file; throws std::runtime_error when it cannot be opened.
std::vector<uint8_t> read_file_bytes(const ImageFile& file, size_t max_bytes = SIZE_MAX);
