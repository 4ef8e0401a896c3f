#include "app/application.hpp"

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace thumbcache;

namespace {

class ApplicationSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Application& app = Application::getInstance();
        m_previousPath = app.getSettingsPath();
        m_path = ::testing::TempDir() + "thumbcache_settings_test.json";
        std::remove(m_path.c_str());
        app.setSettingsPath(m_path);
        app.getSettings() = AppSettings();
    }

    void TearDown() override {
        Application& app = Application::getInstance();
        std::remove(m_path.c_str());
        app.setSettingsPath(m_previousPath);
        app.getSettings() = AppSettings();
    }

    void writeFile(const std::string& content) {
        std::ofstream file(m_path);
        file << content;
    }

    std::string readFile() {
        std::ifstream file(m_path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::string m_path;
    std::string m_previousPath;
};

} // namespace

TEST_F(ApplicationSettingsTest, MissingFileKeepsDefaults) {
    Application& app = Application::getInstance();
    EXPECT_FALSE(app.loadSettings());
    EXPECT_EQ(app.getSettings().cacheSizeMB, 100);
    EXPECT_EQ(app.getSettings().warmupRequests, 12);
    EXPECT_EQ(app.getSettings().warmupWindowMs, 3000);
}

TEST_F(ApplicationSettingsTest, SaveThenLoadRestoresValues) {
    Application& app = Application::getInstance();
    AppSettings& settings = app.getSettings();
    settings.debugLogging = true;
    settings.cacheSizeMB = 48;
    settings.maxThumbnailSize = 320;
    settings.workerCount = 2;
    settings.maxConcurrentDecodes = 1;
    settings.warmupRequests = 4;
    settings.warmupWindowMs = 1500;
    settings.visibilityMargin = 64;
    ASSERT_TRUE(app.saveSettings());

    EXPECT_NE(readFile().find("\"cacheSizeMB\": 48"), std::string::npos);

    app.getSettings() = AppSettings();
    ASSERT_TRUE(app.loadSettings());
    EXPECT_TRUE(settings.debugLogging);
    EXPECT_EQ(settings.cacheSizeMB, 48);
    EXPECT_EQ(settings.maxThumbnailSize, 320);
    EXPECT_EQ(settings.workerCount, 2);
    EXPECT_EQ(settings.maxConcurrentDecodes, 1);
    EXPECT_EQ(settings.warmupRequests, 4);
    EXPECT_EQ(settings.warmupWindowMs, 1500);
    EXPECT_EQ(settings.visibilityMargin, 64);
}

TEST_F(ApplicationSettingsTest, MissingKeysKeepTheirDefaults) {
    writeFile("{\n  \"cacheSizeMB\": 16\n}\n");

    Application& app = Application::getInstance();
    ASSERT_TRUE(app.loadSettings());
    EXPECT_EQ(app.getSettings().cacheSizeMB, 16);
    EXPECT_FALSE(app.getSettings().debugLogging);
    EXPECT_EQ(app.getSettings().workerCount, 0);
    EXPECT_EQ(app.getSettings().warmupRequests, 12);
    EXPECT_EQ(app.getSettings().visibilityMargin, 200);
}

TEST_F(ApplicationSettingsTest, OutOfRangeValuesAreClamped) {
    writeFile("{\"cacheSizeMB\": 1, \"workerCount\": 500, \"maxThumbnailSize\": -3, "
              "\"warmupWindowMs\": 999999}");

    Application& app = Application::getInstance();
    ASSERT_TRUE(app.loadSettings());
    EXPECT_EQ(app.getSettings().cacheSizeMB, 8);
    EXPECT_EQ(app.getSettings().workerCount, 64);
    EXPECT_EQ(app.getSettings().maxThumbnailSize, 0);
    EXPECT_EQ(app.getSettings().warmupWindowMs, 60000);
}

TEST_F(ApplicationSettingsTest, CacheOptionsFollowSettings) {
    Application& app = Application::getInstance();
    AppSettings& settings = app.getSettings();
    settings.cacheSizeMB = 32;
    settings.workerCount = 3;
    settings.maxConcurrentDecodes = 2;
    settings.warmupRequests = 0;
    settings.warmupWindowMs = 250;

    ThumbnailCacheOptions options = app.getCacheOptions();
    EXPECT_EQ(options.maxBytes, static_cast<size_t>(32) * 1024 * 1024);
    EXPECT_EQ(options.pool.workerCount, 3);
    EXPECT_EQ(options.maxConcurrentDecodes, 2);
    EXPECT_EQ(options.pool.warmupRequests, 0);
    EXPECT_EQ(options.pool.warmupWindowMs, 250);
}
