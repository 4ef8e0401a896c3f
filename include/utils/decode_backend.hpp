/**
 * ThumbCache - Image sources and decode backends
 */

#pragma once

#include "utils/decoded_bitmap.hpp"
#include <memory>
#include <string>
#include <vector>

namespace thumbcache {

// Readable encoded-image source handed over by the source provider.
// Either a file path or an in-memory buffer (shared, never copied per request).
struct ImageSource {
    std::string path;
    std::shared_ptr<const std::vector<uint8_t>> bytes;

    static ImageSource fromFile(const std::string& path);
    static ImageSource fromMemory(std::vector<uint8_t> data);

    // Short description for log lines
    std::string describe() const;
};

// Read the encoded bytes of a source (runs on worker threads)
bool readImageSource(const ImageSource& source, std::vector<uint8_t>& data, std::string& error);

/**
 * Decode primitive: encoded bytes in, RGBA bitmap out.
 * Implementations must be safe to call from several worker threads at once.
 */
class DecodeBackend {
public:
    virtual ~DecodeBackend() = default;

    // Returns false and fills error on unreadable, corrupt or unsupported input
    virtual bool decode(const ImageSource& source, DecodedBitmap& bitmap, std::string& error) const = 0;
};

enum class ImageFormat {
    UNKNOWN = 0,
    JPEG,
    PNG,
    GIF,
    BMP,
    WEBP
};

// Identify the container from its magic number
ImageFormat sniffImageFormat(const uint8_t* data, size_t size);

// Box-filter (area averaging) downscale of an RGBA buffer
void downscaleRGBA(const uint8_t* src, int srcW, int srcH, uint8_t* dst, int dstW, int dstH);

/**
 * Default backend: libwebp for WebP, stb_image for everything else.
 * Optionally downscales so the longest edge fits maxThumbnailSize.
 */
class StbDecodeBackend : public DecodeBackend {
public:
    explicit StbDecodeBackend(int maxThumbnailSize = 0);

    bool decode(const ImageSource& source, DecodedBitmap& bitmap, std::string& error) const override;

    // Decode an already-read buffer
    bool decodeBuffer(const uint8_t* data, size_t size, DecodedBitmap& bitmap, std::string& error) const;

    int getMaxThumbnailSize() const { return m_maxThumbnailSize; }

private:
    void fitToThumbnail(const uint8_t* rgba, int width, int height, DecodedBitmap& bitmap) const;

    int m_maxThumbnailSize;  // 0 = keep full size
};

} // namespace thumbcache
