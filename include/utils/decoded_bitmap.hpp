/**
 * ThumbCache - Decoded bitmap and cache entry types
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace thumbcache {

// RGBA8 pixel buffer produced by a decode backend
struct DecodedBitmap {
    std::vector<uint8_t> pixels;  // width * height * 4 bytes, row-major
    int width = 0;
    int height = 0;
};

// Shared handle to a decoded bitmap. The cache is one holder among many:
// dropping the cache's handle never frees pixels another holder still uses.
using BitmapHandle = std::shared_ptr<const DecodedBitmap>;

// One resident cache entry
struct CacheEntry {
    BitmapHandle bitmap;
    int width = 0;
    int height = 0;
    size_t size = 0;  // width * height * 4 (RGBA)
};

// Byte cost used for budget accounting
inline size_t bitmapByteSize(int width, int height) {
    if (width <= 0 || height <= 0) return 0;
    return static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
}

// Build a cache entry around a decoded bitmap
inline CacheEntry makeCacheEntry(BitmapHandle bitmap) {
    CacheEntry entry;
    if (bitmap) {
        entry.width = bitmap->width;
        entry.height = bitmap->height;
        entry.size = bitmapByteSize(bitmap->width, bitmap->height);
    }
    entry.bitmap = std::move(bitmap);
    return entry;
}

// Completion payload delivered to get() callers
struct LoadResult {
    bool success = false;
    CacheEntry entry;
    std::string error;  // Set when success == false
};

} // namespace thumbcache
