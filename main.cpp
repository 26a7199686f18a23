// main.cpp
#include "BitmapCache.hpp"
#include "DecodePipeline.hpp"
#include "Dispatcher.hpp"
#include "FormatDecoder.hpp"
#include "Logger.hpp"
#include "MemoryBudget.hpp"
#include "MetadataIndex.hpp"
#include "MetadataProvider.hpp"
#include "PrefetchCoordinator.hpp"
#include "StandardImageDecoder.hpp"
#include "Warmup.hpp"
#include "requirements.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <algorithm>
#include <sstream>
#include <string>

void print_help() {
    std::cout << "Usage:\n"
              << "  ./pixcache <folder>          Browse a folder (commands on stdin)\n"
              << "  ./pixcache warm <folder>     Decode the whole folder into the cache and print stats\n"
              << "  ./pixcache -h, --help        Show this help message\n"
              << "\n"
              << "Commands: next | prev | goto N | scroll A B | stats | clear | trim R | quit\n"
              << "Config:   ./config.json, or the path in PIXCACHE_CONFIG\n";
}

// Viewer state seen by the prefetcher.
class FolderHost : public PrefetchHost {
public:
    explicit FolderHost(std::vector<ImageFilePtr> files) : files_(std::move(files)) {}

    std::vector<ImageFilePtr> files() const override { return files_; }
    int current_index() const override { return current_.load(); }
    bool is_foreground_loading() const override { return loading_.load(); }
    bool is_thumbnail_loading_busy() const override { return false; }

    void set_current(int i) { current_.store(i); }
    void set_loading(bool on) { loading_.store(on); }
    int size() const { return static_cast<int>(files_.size()); }
    const ImageFilePtr& at(int i) const { return files_[static_cast<size_t>(i)]; }

private:
    std::vector<ImageFilePtr> files_;
    std::atomic<int> current_{-1};
    std::atomic<bool> loading_{false};
};


static void show(BitmapCache& cache, PrefetchCoordinator& prefetch, FolderHost& host, int index) {
    if (host.size() == 0) return;
    index = std::max(0, std::min(index, host.size() - 1));
    host.set_current(index);
    host.set_loading(true);
    prefetch.notify_current_changed();

    const ImageFilePtr& file = host.at(index);
    BitmapPtr bmp = cache.get_bitmap(*file);
    host.set_loading(false);

    std::cout << "[" << (index + 1) << "/" << host.size() << "] " << file->name();
    if (bmp) std::cout << "  " << bmp->width() << "x" << bmp->height();
    else     std::cout << "  (cannot decode)";
    std::cout << "\n";
}


static int browse(BitmapCache& cache, const ConfigManager& cfg, std::vector<ImageFilePtr> files, int log_fd) {
    FolderHost host(std::move(files));
    PrefetchCoordinator prefetch(cache, host, cfg.getPrefetchSettings(), log_fd);

    int current = 0;
    show(cache, prefetch, host, current);

    std::string line;
    while (std::cout << "> " << std::flush && std::getline(std::cin, line)) {
        std::istringstream in(line);
        std::string cmd;
        in >> cmd;
        if (cmd.empty()) continue;

        if (cmd == "quit" || cmd == "q") break;
        if (cmd == "next" || cmd == "n") {
            if (current + 1 < host.size()) ++current;
            show(cache, prefetch, host, current);
        } else if (cmd == "prev" || cmd == "p") {
            if (current > 0) --current;
            show(cache, prefetch, host, current);
        } else if (cmd == "goto") {
            int n = 0;
            if (!(in >> n) || n < 1 || n > host.size()) { std::cout << "goto expects 1.." << host.size() << "\n"; continue; }
            current = n - 1;
            show(cache, prefetch, host, current);
        } else if (cmd == "scroll") {
            int a = 0, b = 0;
            if (!(in >> a >> b)) { std::cout << "scroll expects two indices\n"; continue; }
            prefetch.notify_visible_range_settled(a - 1, b - 1);
        } else if (cmd == "stats") {
            std::cout << cache.stats_info() << ", reserved " << cache.reserved_bytes() << " bytes\n";
        } else if (cmd == "clear") {
            cache.clear();
            std::cout << cache.stats_info() << "\n";
        } else if (cmd == "trim") {
            double r = 0.5;
            in >> r;
            auto ba = cache.trim_on_memory_warning(r);
            std::cout << "trimmed " << ba.first / (1024 * 1024) << " MB -> " << ba.second / (1024 * 1024) << " MB\n";
        } else {
            std::cout << "unknown command: " << cmd << "\n";
        }
    }
    prefetch.cancel_all();
    return 0;
}


int main(int argc, char** argv) {
    // Handle help flag early
    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        print_help();
        return argc < 2 ? 1 : 0;
    }
    const bool warm = std::string(argv[1]) == "warm";
    if (warm && argc < 3) {
        std::cerr << "Usage: " << argv[0] << " warm <folder>\n";
        return 1;
    }
    const std::string folder = warm ? argv[2] : argv[1];

    const char* config_env = std::getenv("PIXCACHE_CONFIG");
    const std::string config_path = config_env ? config_env : "./config.json";

    auto boot = Requirements::run(config_path);
    if (!boot.ok) {
        std::cerr << "[Main] aborted: " << boot.error << "\n";
        return 1;
    }
    const ConfigManager& cfg = boot.config;

    Logger logger;
    if (!logger.start(cfg.getLogPath())) {
        std::cerr << "[Main] logger unavailable, logging to stderr\n";
    }
    const int log_fd = logger.fd();

    ExifMetadataProvider exif(log_fd);
    MetadataIndex metadata(exif, boot.db.get(), log_fd);
    StandardImageDecoder standard;
    NoopFormatDecoder alternate;
    DecodePipeline pipeline(standard, alternate, metadata, cfg.getAlternateExtensions(),
                            log_fd, cfg.getDecodeConcurrency());
    pipeline.set_strip_alpha(cfg.getStripAlpha());

    ThreadDispatcher ui(log_fd);
    const CacheLimits limits = cfg.cacheLimits(MemoryBudget::app_memory_limit_mb());
    log_line(log_fd, "Main", "cache limits: " + std::to_string(limits.max_count) + " items, " +
             std::to_string(limits.max_size / (1024 * 1024)) + " MB");

    int rc = 0;
    {
        BitmapCache cache(pipeline, metadata, ui, limits, log_fd, static_cast<size_t>(cfg.getWorkers()));

        const auto paths = Warmup::list_image_files(folder, cfg.getAlternateExtensions());
        if (paths.empty()) {
            std::cerr << "[Main] no images in " << folder << "\n";
            rc = 1;
        } else if (warm) {
            CancellationSource never;
            Warmup::warm_folder(cache, Warmup::open_local_files(paths), never.token(), log_fd);
            cache.wait_idle();
            std::cout << cache.stats_info() << "\n";
        } else {
            rc = browse(cache, cfg, Warmup::open_local_files(paths), log_fd);
        }
    }
    ui.stop();
    logger.stop();
    return rc;
}
