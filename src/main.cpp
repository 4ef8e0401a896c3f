/**
 * ThumbCache - thumbcache_prime
 * Decodes every image in a directory through the thumbnail cache and reports cache usage.
 * Usage: thumbcache_prime <directory> [settings.json]
 */

#include "app/application.hpp"

#include <borealis.hpp>
#include <dirent.h>
#include <cctype>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

using namespace thumbcache;

static bool hasImageExtension(const std::string& name) {
    size_t dot = name.rfind('.');
    if (dot == std::string::npos) return false;
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext == "jpg" || ext == "jpeg" || ext == "png" || ext == "gif" ||
           ext == "bmp" || ext == "tga" || ext == "webp";
}

static std::vector<std::string> listImages(const std::string& dirPath) {
    std::vector<std::string> files;
    DIR* dir = opendir(dirPath.c_str());
    if (!dir) {
        brls::Logger::error("thumbcache_prime: Cannot open directory {}", dirPath);
        return files;
    }
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (hasImageExtension(name)) {
            files.push_back(name);
        }
    }
    closedir(dir);
    std::sort(files.begin(), files.end());
    return files;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <directory> [settings.json]\n", argv[0]);
        return 1;
    }

    std::string dirPath = argv[1];
    Application& app = Application::getInstance();
    if (argc > 2) {
        app.setSettingsPath(argv[2]);
    }
    if (!app.init()) {
        return 1;
    }

    ThumbnailCache& cache = app.getThumbnailCache();
    // No UI loop here: this thread pumps replies itself
    cache.setReplyNotifier(nullptr);

    std::vector<std::string> files = listImages(dirPath);
    brls::Logger::info("thumbcache_prime: {} images in {}", files.size(), dirPath);

    size_t completed = 0;
    size_t failed = 0;
    auto started = std::chrono::steady_clock::now();

    for (size_t i = 0; i < files.size(); i++) {
        const std::string& name = files[i];
        // Earlier files sit at the front of the stack
        int priority = static_cast<int>(i / 8);
        cache.get(name, ImageSource::fromFile(dirPath + "/" + name),
                  [&completed, &failed, name](const LoadResult& result) {
                      completed++;
                      if (result.success) {
                          brls::Logger::debug("thumbcache_prime: {} -> {}x{}", name,
                                              result.entry.width, result.entry.height);
                      } else {
                          failed++;
                          brls::Logger::warning("thumbcache_prime: {} failed: {}", name, result.error);
                      }
                  },
                  priority);
    }

    while (completed < files.size()) {
        if (cache.waitAndPump(std::chrono::milliseconds(1000)) == 0 &&
            cache.getActiveDecodes() == 0 && cache.getQueuedCount() == 0) {
            break;
        }
    }

    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    CacheStats stats = cache.stats();

    std::printf("Decoded %zu images (%zu failed) in %lld ms\n", completed - failed, failed,
                static_cast<long long>(elapsedMs));
    std::printf("Inline decodes: %llu, worker decodes: %llu\n",
                static_cast<unsigned long long>(cache.getWorkerPool().getInlineDecodeCount()),
                static_cast<unsigned long long>(cache.getWorkerPool().getWorkerDecodeCount()));
    std::printf("Cache: %zu entries, %zu / %zu bytes (%s)\n", stats.count, stats.totalBytes, stats.maxBytes,
                formatUtilization(stats).c_str());

    app.shutdown();
    return failed == 0 ? 0 : 2;
}
