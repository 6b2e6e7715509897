// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

// Define STB implementations in this compilation unit only
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION

#include "image_bitmap.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

// stb headers - single-file libraries for image processing
#include "stb_image.h"
#include "stb_image_resize.h"
#include "stb_image_write.h"

namespace thumbkit {

// Safety limits to prevent memory exhaustion and integer overflow
static constexpr size_t MAX_INPUT_SIZE = 32 * 1024 * 1024; // 32 MB compressed
static constexpr int MAX_SOURCE_DIMENSION = 16384;
static constexpr int MAX_OUTPUT_DIMENSION = 8192;

std::string ImageSize::to_string() const {
    return std::to_string(width) + "x" + std::to_string(height);
}

DecodeResult decode_image(const std::vector<uint8_t>& data) {
    DecodeResult result;

    if (data.empty()) {
        result.error = "Empty image data";
        return result;
    }

    if (data.size() > MAX_INPUT_SIZE) {
        result.error = "Image too large (" + std::to_string(data.size() / 1024 / 1024) +
                       " MB, max " + std::to_string(MAX_INPUT_SIZE / 1024 / 1024) + " MB)";
        return result;
    }

    int width = 0, height = 0, channels = 0;

    // Request RGBA output regardless of source format
    unsigned char* pixels = stbi_load_from_memory(data.data(), static_cast<int>(data.size()),
                                                  &width, &height, &channels, 4);
    if (!pixels) {
        result.error = std::string("Failed to decode image: ") + stbi_failure_reason();
        return result;
    }

    if (width <= 0 || height <= 0 || width > MAX_SOURCE_DIMENSION ||
        height > MAX_SOURCE_DIMENSION) {
        stbi_image_free(pixels);
        result.error = "Image dimensions out of range (" + std::to_string(width) + "x" +
                       std::to_string(height) + ")";
        return result;
    }

    auto bitmap = std::make_shared<Bitmap>();
    bitmap->width = width;
    bitmap->height = height;
    bitmap->pixels.assign(pixels, pixels + bitmap->byte_size());
    stbi_image_free(pixels);

    spdlog::trace("[ImageBitmap] Decoded {}x{} ({} channels)", width, height, channels);

    result.image = std::move(bitmap);
    return result;
}

ImageSize fit_within(const ImageSize& source, const ImageSize& target) {
    if (!source.is_valid() || !target.is_valid()) {
        return {};
    }

    // Using min() ensures the image never exceeds the target box
    double scale_x = static_cast<double>(target.width) / source.width;
    double scale_y = static_cast<double>(target.height) / source.height;
    double scale = std::min(scale_x, scale_y);

    ImageSize out;
    out.width = static_cast<int>(source.width * scale + 0.5);
    out.height = static_cast<int>(source.height * scale + 0.5);

    out.width = std::clamp(out.width, 1, std::min(target.width, MAX_OUTPUT_DIMENSION));
    out.height = std::clamp(out.height, 1, std::min(target.height, MAX_OUTPUT_DIMENSION));
    return out;
}

ImagePtr scale_to_fit(const ImagePtr& source, const ImageSize& target) {
    if (!source || !target.is_valid() || !source->size().is_valid()) {
        return nullptr;
    }

    ImageSize out_size = fit_within(source->size(), target);
    if (out_size == source->size()) {
        return source;
    }

    auto scaled = std::make_shared<Bitmap>();
    scaled->width = out_size.width;
    scaled->height = out_size.height;
    scaled->pixels.resize(scaled->byte_size());

    int ok = stbir_resize_uint8(source->pixels.data(), source->width, source->height, 0,
                                scaled->pixels.data(), scaled->width, scaled->height, 0, 4);
    if (!ok) {
        spdlog::warn("[ImageBitmap] Failed to resize {}x{} -> {}", source->width,
                     source->height, out_size.to_string());
        return nullptr;
    }

    spdlog::trace("[ImageBitmap] Scaled {}x{} -> {}", source->width, source->height,
                  out_size.to_string());
    return scaled;
}

namespace {

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

bool encode_jpeg(const Bitmap& bitmap, int quality, std::vector<uint8_t>& out) {
    if (!bitmap.size().is_valid() || bitmap.pixels.size() < bitmap.byte_size()) {
        return false;
    }
    quality = std::clamp(quality, 1, 100);

    // JPEG has no alpha: composite onto white, RGBA -> RGB
    const size_t pixel_count = static_cast<size_t>(bitmap.width) * bitmap.height;
    std::vector<uint8_t> rgb(pixel_count * 3);
    for (size_t i = 0; i < pixel_count; ++i) {
        const uint8_t* src = &bitmap.pixels[i * 4];
        unsigned alpha = src[3];
        for (int c = 0; c < 3; ++c) {
            rgb[i * 3 + c] = static_cast<uint8_t>((src[c] * alpha + 255 * (255 - alpha)) / 255);
        }
    }

    out.clear();
    int ok = stbi_write_jpg_to_func(append_to_vector, &out, bitmap.width, bitmap.height, 3,
                                    rgb.data(), quality);
    return ok != 0 && !out.empty();
}

ImagePtr make_solid_bitmap(int width, int height, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    auto bitmap = std::make_shared<Bitmap>();
    bitmap->width = std::max(width, 0);
    bitmap->height = std::max(height, 0);
    bitmap->pixels.resize(bitmap->byte_size());
    for (size_t i = 0; i < bitmap->pixels.size(); i += 4) {
        bitmap->pixels[i] = r;
        bitmap->pixels[i + 1] = g;
        bitmap->pixels[i + 2] = b;
        bitmap->pixels[i + 3] = a;
    }
    return bitmap;
}

} // namespace thumbkit
