/**
 * ThumbCache - Application composition root
 * Owns the settings and the thumbnail cache used by the catalog views
 */

#pragma once

#include "utils/thumbnail_cache.hpp"
#include "view/viewport_visibility.hpp"
#include <atomic>
#include <memory>
#include <string>

// Application version
#define THUMBCACHE_VERSION "1.0.0"
#define THUMBCACHE_VERSION_NUM 100

namespace thumbcache {

// Application settings structure
struct AppSettings {
    bool debugLogging = false;

    // Thumbnail cache
    int cacheSizeMB = 100;           // Soft budget for decoded bitmaps
    int maxThumbnailSize = 0;        // Longest edge after decode (0 = keep full size)

    // Decode scheduling
    int workerCount = 0;             // 0 = one per core, clamped to the platform cap
    int maxConcurrentDecodes = 0;    // 0 = derived from the worker count
    int warmupRequests = 12;         // First N decodes run inline while workers spin up
    int warmupWindowMs = 3000;       // Decodes within this window run inline too
    int visibilityMargin = 200;      // Pixels around the screen still counted as visible
};

/**
 * Application singleton - manages lifecycle, settings and the thumbnail cache
 */
class Application {
public:
    static Application& getInstance();

    bool init();
    void shutdown();
    bool isInitialized() const { return m_initialized; }

    // Settings persistence
    bool loadSettings();
    bool saveSettings();
    void setSettingsPath(const std::string& path) { m_settingsPath = path; }
    const std::string& getSettingsPath() const { return m_settingsPath; }

    AppSettings& getSettings() { return m_settings; }
    const AppSettings& getSettings() const { return m_settings; }

    // Apply log level based on settings
    void applyLogLevel();

    // Options the cache is built from, derived from the current settings
    ThumbnailCacheOptions getCacheOptions() const;

    // Valid between init() and shutdown()
    ThumbnailCache& getThumbnailCache() { return *m_thumbnailCache; }
    ViewportVisibilityOracle& getVisibilityOracle() { return m_visibilityOracle; }

private:
    Application();
    ~Application() = default;
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Coalesce worker replies into one pump per frame on the UI thread
    void schedulePump();

    bool m_initialized = false;
    std::string m_settingsPath;
    AppSettings m_settings;
    ViewportVisibilityOracle m_visibilityOracle;
    std::unique_ptr<ThumbnailCache> m_thumbnailCache;
    std::atomic<bool> m_pumpScheduled{false};
};

} // namespace thumbcache
