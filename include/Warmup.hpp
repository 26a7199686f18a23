#pragma once
#include <string>
#include <vector>
#include "BitmapCache.hpp"
#include "Cancellation.hpp"
#include "ImageFile.hpp"

namespace Warmup {

// Regular files of dir with a standard (.jpg .jpeg .png) or listed alternate
// extension, sorted by name. Empty when the directory cannot be read.
std::vector<std::string> list_image_files(const std::string& dir,
                                          const std::vector<std::string>& alternate_exts);

std::vector<ImageFilePtr> open_local_files(const std::vector<std::string>& paths);

// Loads the folder in order through the cache and logs a summary line.
size_t warm_folder(BitmapCache& cache, const std::vector<ImageFilePtr>& files,
                   const CancellationToken& token, int log_fd);
}
