#include "Warmup.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>
#include <dirent.h>
#include <sys/stat.h>
#include <cstring>


static const size_t kMaxFilesTotal = 100000;

static const char* const kStandardExts[] = { ".jpg", ".jpeg", ".jpe", ".png" };


namespace Warmup {

std::vector<std::string> list_image_files(const std::string& dir,
                                          const std::vector<std::string>& alternate_exts) {
    std::vector<std::string> out;
    const std::string root = normalize_path(dir);
    DIR* d = opendir(root.c_str());
    if (!d) return out;

    struct dirent* ent;
    while ((ent = readdir(d)) != nullptr) {
        if (::strcmp(ent->d_name, ".") == 0 || ::strcmp(ent->d_name, "..") == 0) continue;
        if (out.size() >= kMaxFilesTotal) break;

        std::string fpath = root + "/" + ent->d_name;
        struct stat st{};
        if (::stat(fpath.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;

        const std::string ext = lower_extension(fpath);
        const bool standard = std::find(std::begin(kStandardExts), std::end(kStandardExts), ext) !=
                              std::end(kStandardExts);
        const bool alternate = std::find(alternate_exts.begin(), alternate_exts.end(), ext) !=
                               alternate_exts.end();
        if (standard || alternate) out.push_back(fpath);
    }
    closedir(d);

    std::sort(out.begin(), out.end());
    return out;
}

std::vector<ImageFilePtr> open_local_files(const std::vector<std::string>& paths) {
    std::vector<ImageFilePtr> files;
    files.reserve(paths.size());
    for (const auto& p : paths) files.push_back(std::make_shared<LocalImageFile>(p));
    return files;
}

size_t warm_folder(BitmapCache& cache, const std::vector<ImageFilePtr>& files,
                   const CancellationToken& token, int log_fd) {
    const auto t0 = std::chrono::steady_clock::now();
    const size_t loaded = cache.preload_sequentially(files, token);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    log_line(log_fd, "Warmup", "decoded " + std::to_string(loaded) + " of " + std::to_string(files.size()) +
             " files in " + std::to_string(ms) + " ms; " + cache.stats_info());
    return loaded;
}

}
