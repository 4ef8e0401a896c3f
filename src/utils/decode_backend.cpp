/**
 * ThumbCache - Decode backend implementation
 * WebP through libwebp, JPEG/PNG/GIF/BMP/TGA through stb_image, RGBA8 output
 */

#include "utils/decode_backend.hpp"

#include <borealis.hpp>
#include <webp/decode.h>
#include <algorithm>
#include <cstring>
#include <fstream>

// Vita I/O for local file loading
#ifdef __vita__
#include <psp2/io/fcntl.h>
#include <psp2/io/stat.h>
#endif

#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG
#define STBI_ONLY_BMP
#define STBI_ONLY_TGA
#define STBI_ONLY_GIF
#define STBI_NO_HDR
#define STBI_NO_LINEAR
#define STB_IMAGE_STATIC
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

namespace thumbcache {

static const size_t MAX_SOURCE_BYTES = 50 * 1024 * 1024;  // Refuse anything over 50MB

ImageSource ImageSource::fromFile(const std::string& path) {
    ImageSource source;
    source.path = path;
    return source;
}

ImageSource ImageSource::fromMemory(std::vector<uint8_t> data) {
    ImageSource source;
    source.bytes = std::make_shared<const std::vector<uint8_t>>(std::move(data));
    return source;
}

std::string ImageSource::describe() const {
    if (!path.empty()) return path;
    if (bytes) return "<memory " + std::to_string(bytes->size()) + " bytes>";
    return "<empty>";
}

bool readImageSource(const ImageSource& source, std::vector<uint8_t>& data, std::string& error) {
    if (source.bytes) {
        data.assign(source.bytes->begin(), source.bytes->end());
        return true;
    }

    if (source.path.empty()) {
        error = "Image source has neither a path nor bytes";
        return false;
    }

#ifdef __vita__
    SceUID fd = sceIoOpen(source.path.c_str(), SCE_O_RDONLY, 0);
    if (fd < 0) {
        error = "Failed to open " + source.path;
        return false;
    }
    SceOff fileSize = sceIoLseek(fd, 0, SCE_SEEK_END);
    sceIoLseek(fd, 0, SCE_SEEK_SET);
    if (fileSize <= 0 || static_cast<size_t>(fileSize) > MAX_SOURCE_BYTES) {
        sceIoClose(fd);
        error = "Invalid file size for " + source.path;
        return false;
    }
    data.resize(fileSize);
    SceSSize bytesRead = sceIoRead(fd, data.data(), fileSize);
    sceIoClose(fd);
    if (bytesRead != fileSize) {
        error = "Short read on " + source.path;
        return false;
    }
#else
    std::ifstream file(source.path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        error = "Failed to open " + source.path;
        return false;
    }
    std::streamsize size = file.tellg();
    if (size <= 0 || static_cast<size_t>(size) > MAX_SOURCE_BYTES) {
        error = "Invalid file size for " + source.path;
        return false;
    }
    file.seekg(0, std::ios::beg);
    data.resize(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        error = "Short read on " + source.path;
        return false;
    }
#endif
    return true;
}

ImageFormat sniffImageFormat(const uint8_t* data, size_t size) {
    if (!data || size < 4) return ImageFormat::UNKNOWN;

    if (data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return ImageFormat::JPEG;
    }
    if (data[0] == 0x89 && data[1] == 0x50 && data[2] == 0x4E && data[3] == 0x47) {
        return ImageFormat::PNG;
    }
    if (data[0] == 0x47 && data[1] == 0x49 && data[2] == 0x46) {
        return ImageFormat::GIF;
    }
    if (data[0] == 0x42 && data[1] == 0x4D) {
        return ImageFormat::BMP;
    }
    if (size > 12 && data[0] == 0x52 && data[1] == 0x49 && data[2] == 0x46 && data[3] == 0x46 &&
        data[8] == 0x57 && data[9] == 0x45 && data[10] == 0x42 && data[11] == 0x50) {
        return ImageFormat::WEBP;
    }
    return ImageFormat::UNKNOWN;
}

void downscaleRGBA(const uint8_t* src, int srcW, int srcH, uint8_t* dst, int dstW, int dstH) {
    float scaleX = (float)srcW / dstW;
    float scaleY = (float)srcH / dstH;

    for (int y = 0; y < dstH; y++) {
        for (int x = 0; x < dstW; x++) {
            // Average every source pixel that maps onto this destination pixel
            int sx0 = (int)(x * scaleX);
            int sy0 = (int)(y * scaleY);
            int sx1 = std::min((int)((x + 1) * scaleX), srcW);
            int sy1 = std::min((int)((y + 1) * scaleY), srcH);

            if (sx1 <= sx0) sx1 = std::min(sx0 + 1, srcW);
            if (sy1 <= sy0) sy1 = std::min(sy0 + 1, srcH);

            unsigned int sumR = 0, sumG = 0, sumB = 0, sumA = 0;
            int count = 0;

            for (int sy = sy0; sy < sy1; sy++) {
                for (int sx = sx0; sx < sx1; sx++) {
                    int srcIdx = (sy * srcW + sx) * 4;
                    sumR += src[srcIdx + 0];
                    sumG += src[srcIdx + 1];
                    sumB += src[srcIdx + 2];
                    sumA += src[srcIdx + 3];
                    count++;
                }
            }
            if (count == 0) count = 1;

            int dstIdx = (y * dstW + x) * 4;
            dst[dstIdx + 0] = static_cast<uint8_t>(sumR / count);
            dst[dstIdx + 1] = static_cast<uint8_t>(sumG / count);
            dst[dstIdx + 2] = static_cast<uint8_t>(sumB / count);
            dst[dstIdx + 3] = static_cast<uint8_t>(sumA / count);
        }
    }
}

StbDecodeBackend::StbDecodeBackend(int maxThumbnailSize)
    : m_maxThumbnailSize(maxThumbnailSize > 0 ? maxThumbnailSize : 0) {
}

bool StbDecodeBackend::decode(const ImageSource& source, DecodedBitmap& bitmap, std::string& error) const {
    // Skip the copy when the provider already handed us the bytes
    if (source.bytes) {
        return decodeBuffer(source.bytes->data(), source.bytes->size(), bitmap, error);
    }

    std::vector<uint8_t> data;
    if (!readImageSource(source, data, error)) {
        return false;
    }
    return decodeBuffer(data.data(), data.size(), bitmap, error);
}

bool StbDecodeBackend::decodeBuffer(const uint8_t* data, size_t size, DecodedBitmap& bitmap,
                                    std::string& error) const {
    if (!data || size == 0) {
        error = "Empty image buffer";
        return false;
    }

    ImageFormat format = sniffImageFormat(data, size);

    if (format == ImageFormat::WEBP) {
        int width = 0, height = 0;
        if (!WebPGetInfo(data, size, &width, &height)) {
            error = "Invalid WebP header";
            return false;
        }
        uint8_t* rgba = WebPDecodeRGBA(data, size, &width, &height);
        if (!rgba) {
            error = "WebP decode failed";
            return false;
        }
        fitToThumbnail(rgba, width, height, bitmap);
        WebPFree(rgba);
        return true;
    }

    if (size > static_cast<size_t>(INT32_MAX)) {
        error = "Image buffer too large";
        return false;
    }

    // For unrecognized headers (.bin, TGA, ...) let stb_image have a look
    if (format == ImageFormat::UNKNOWN) {
        int testW, testH, testC;
        if (!stbi_info_from_memory(data, static_cast<int>(size), &testW, &testH, &testC)) {
            error = "Unrecognized image format";
            return false;
        }
        brls::Logger::debug("StbDecodeBackend: stb_image detected unknown format {}x{}", testW, testH);
    }

    int width, height, channels;
    // Force 4 channels (RGBA)
    uint8_t* rgba = stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels, 4);
    if (!rgba) {
        const char* reason = stbi_failure_reason();
        error = std::string("stb_image failed to decode image: ") + (reason ? reason : "unknown");
        return false;
    }

    fitToThumbnail(rgba, width, height, bitmap);
    stbi_image_free(rgba);
    return true;
}

void StbDecodeBackend::fitToThumbnail(const uint8_t* rgba, int width, int height, DecodedBitmap& bitmap) const {
    int targetW = width;
    int targetH = height;

    if (m_maxThumbnailSize > 0 && (width > m_maxThumbnailSize || height > m_maxThumbnailSize)) {
        float scale = (float)m_maxThumbnailSize / std::max(width, height);
        targetW = std::max(1, (int)(width * scale));
        targetH = std::max(1, (int)(height * scale));
    }

    bitmap.width = targetW;
    bitmap.height = targetH;
    bitmap.pixels.resize(bitmapByteSize(targetW, targetH));

    if (targetW != width || targetH != height) {
        downscaleRGBA(rgba, width, height, bitmap.pixels.data(), targetW, targetH);
    } else {
        std::memcpy(bitmap.pixels.data(), rgba, bitmap.pixels.size());
    }
}

} // namespace thumbcache
