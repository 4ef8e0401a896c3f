/**
 * ThumbCache - Application implementation
 */

#include "app/application.hpp"

#include <borealis.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

#ifdef __vita__
#include <psp2/io/fcntl.h>
#include <psp2/io/stat.h>
#endif

namespace thumbcache {

#ifdef __vita__
static const char* SETTINGS_PATH = "ux0:data/ThumbCache/settings.json";
#else
static const char* SETTINGS_PATH = "./ThumbCache_settings.json";
#endif

Application& Application::getInstance() {
    static Application instance;
    return instance;
}

Application::Application()
    : m_settingsPath(SETTINGS_PATH) {
}

bool Application::init() {
    if (m_initialized) return true;

    brls::Logger::setLogLevel(brls::LogLevel::LOG_DEBUG);
    brls::Logger::info("ThumbCache {} initializing...", THUMBCACHE_VERSION);

#ifdef __vita__
    int ret = sceIoMkdir("ux0:data/ThumbCache", 0777);
    brls::Logger::debug("sceIoMkdir result: {:#x}", ret);
#endif

    bool loaded = loadSettings();
    brls::Logger::info("Settings load result: {}", loaded ? "success" : "failed/not found");

    applyLogLevel();

    m_visibilityOracle.setMargin(static_cast<float>(m_settings.visibilityMargin));
    std::shared_ptr<const DecodeBackend> backend =
        std::make_shared<StbDecodeBackend>(m_settings.maxThumbnailSize);
    m_thumbnailCache = std::make_unique<ThumbnailCache>(getCacheOptions(), backend, &m_visibilityOracle);
    m_thumbnailCache->setReplyNotifier([this]() {
        schedulePump();
    });

    m_initialized = true;
    return true;
}

void Application::shutdown() {
    if (!m_initialized) return;

    saveSettings();
    if (m_thumbnailCache) {
        m_thumbnailCache->shutdown();
        CacheStats stats = m_thumbnailCache->stats();
        brls::Logger::info("Thumbnail cache at exit: {} entries, {} bytes ({})",
                           stats.count, stats.totalBytes, formatUtilization(stats));
        m_thumbnailCache.reset();
    }
    m_initialized = false;
    brls::Logger::info("ThumbCache shutting down");
}

void Application::schedulePump() {
    // May be called from worker threads; only one pump is queued at a time
    bool expected = false;
    if (m_pumpScheduled.compare_exchange_strong(expected, true)) {
        brls::sync([this]() {
            m_pumpScheduled = false;
            if (m_thumbnailCache) {
                m_thumbnailCache->pump();
            }
        });
    }
}

ThumbnailCacheOptions Application::getCacheOptions() const {
    ThumbnailCacheOptions options;
    options.maxBytes = static_cast<size_t>(m_settings.cacheSizeMB) * 1024 * 1024;
    options.maxConcurrentDecodes = m_settings.maxConcurrentDecodes;
    options.pool.workerCount = m_settings.workerCount;
    options.pool.warmupRequests = m_settings.warmupRequests;
    options.pool.warmupWindowMs = m_settings.warmupWindowMs;
    return options;
}

void Application::applyLogLevel() {
    if (m_settings.debugLogging) {
        brls::Logger::setLogLevel(brls::LogLevel::LOG_DEBUG);
    } else {
        brls::Logger::setLogLevel(brls::LogLevel::LOG_INFO);
    }
}

bool Application::loadSettings() {
    brls::Logger::debug("loadSettings: Opening {}", m_settingsPath);

    std::string content;

#ifdef __vita__
    SceUID fd = sceIoOpen(m_settingsPath.c_str(), SCE_O_RDONLY, 0);
    if (fd < 0) {
        brls::Logger::debug("No settings file found (error: {:#x})", fd);
        return false;
    }

    SceOff size = sceIoLseek(fd, 0, SCE_SEEK_END);
    sceIoLseek(fd, 0, SCE_SEEK_SET);

    if (size <= 0 || size > 16384) {
        brls::Logger::error("loadSettings: Invalid file size");
        sceIoClose(fd);
        return false;
    }

    content.resize(size);
    sceIoRead(fd, &content[0], size);
    sceIoClose(fd);
#else
    std::ifstream file(m_settingsPath);
    if (!file.is_open()) {
        brls::Logger::debug("No settings file found");
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    file.close();
#endif

    brls::Logger::debug("loadSettings: Read {} bytes", content.length());

    // Parse integers; missing keys keep their default
    auto extractInt = [&content](const std::string& key, int defaultVal) -> int {
        std::string search = "\"" + key + "\":";
        size_t pos = content.find(search);
        if (pos == std::string::npos) return defaultVal;
        pos += search.length();
        while (pos < content.length() && (content[pos] == ' ' || content[pos] == '\t')) pos++;
        size_t end = content.find_first_of(",}\n", pos);
        if (end == std::string::npos) return defaultVal;
        return atoi(content.substr(pos, end - pos).c_str());
    };

    // Parse booleans
    auto extractBool = [&content](const std::string& key, bool defaultVal = false) -> bool {
        std::string search = "\"" + key + "\":";
        size_t pos = content.find(search);
        if (pos == std::string::npos) return defaultVal;
        pos += search.length();
        while (pos < content.length() && (content[pos] == ' ' || content[pos] == '\t')) pos++;
        return (content.substr(pos, 4) == "true");
    };

    auto clampInt = [](int value, int lo, int hi) {
        return std::max(lo, std::min(value, hi));
    };

    AppSettings defaults;
    m_settings.debugLogging = extractBool("debugLogging", defaults.debugLogging);
    m_settings.cacheSizeMB = clampInt(extractInt("cacheSizeMB", defaults.cacheSizeMB), 8, 1024);
    m_settings.maxThumbnailSize = clampInt(extractInt("maxThumbnailSize", defaults.maxThumbnailSize), 0, 4096);
    m_settings.workerCount = clampInt(extractInt("workerCount", defaults.workerCount), 0, 64);
    m_settings.maxConcurrentDecodes =
        clampInt(extractInt("maxConcurrentDecodes", defaults.maxConcurrentDecodes), 0, 64);
    m_settings.warmupRequests = clampInt(extractInt("warmupRequests", defaults.warmupRequests), 0, 1000);
    m_settings.warmupWindowMs = clampInt(extractInt("warmupWindowMs", defaults.warmupWindowMs), 0, 60000);
    m_settings.visibilityMargin = clampInt(extractInt("visibilityMargin", defaults.visibilityMargin), 0, 4096);

    brls::Logger::info("loadSettings: cacheSizeMB={}, workerCount={}, maxConcurrentDecodes={}",
                       m_settings.cacheSizeMB, m_settings.workerCount, m_settings.maxConcurrentDecodes);
    brls::Logger::info("loadSettings: warmupRequests={}, warmupWindowMs={}",
                       m_settings.warmupRequests, m_settings.warmupWindowMs);

    brls::Logger::info("Settings loaded successfully");
    return true;
}

bool Application::saveSettings() {
    brls::Logger::info("saveSettings: Saving to {}", m_settingsPath);

    std::string json = "{\n";
    json += "  \"debugLogging\": " + std::string(m_settings.debugLogging ? "true" : "false") + ",\n";
    json += "  \"cacheSizeMB\": " + std::to_string(m_settings.cacheSizeMB) + ",\n";
    json += "  \"maxThumbnailSize\": " + std::to_string(m_settings.maxThumbnailSize) + ",\n";
    json += "  \"workerCount\": " + std::to_string(m_settings.workerCount) + ",\n";
    json += "  \"maxConcurrentDecodes\": " + std::to_string(m_settings.maxConcurrentDecodes) + ",\n";
    json += "  \"warmupRequests\": " + std::to_string(m_settings.warmupRequests) + ",\n";
    json += "  \"warmupWindowMs\": " + std::to_string(m_settings.warmupWindowMs) + ",\n";
    json += "  \"visibilityMargin\": " + std::to_string(m_settings.visibilityMargin) + "\n";
    json += "}\n";

#ifdef __vita__
    SceUID fd = sceIoOpen(m_settingsPath.c_str(), SCE_O_WRONLY | SCE_O_CREAT | SCE_O_TRUNC, 0777);
    if (fd < 0) {
        brls::Logger::error("Failed to open settings file for writing: {:#x}", fd);
        return false;
    }

    int written = sceIoWrite(fd, json.c_str(), json.length());
    sceIoClose(fd);

    if (written != static_cast<int>(json.length())) {
        brls::Logger::error("Failed to write settings file");
        return false;
    }
    brls::Logger::info("Settings saved successfully ({} bytes)", written);
#else
    std::ofstream file(m_settingsPath);
    if (!file.is_open()) {
        brls::Logger::error("Failed to open settings file for writing");
        return false;
    }
    file << json;
    file.close();
    if (!file) {
        brls::Logger::error("Failed to write settings file");
        return false;
    }
    brls::Logger::info("Settings saved successfully ({} bytes)", json.length());
#endif

    return true;
}

} // namespace thumbcache
