// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/**
 * @file image_bitmap.h
 * @brief Decoded RGBA bitmaps and the codec operations the cache needs
 *
 * Bitmaps are immutable once created and shared through ImagePtr, so the
 * memory cache, the loader and every listener can hold the same pixels
 * without copying.
 */

namespace thumbkit {

/**
 * @brief Target dimensions for a thumbnail variant
 */
struct ImageSize {
    int width = 0;
    int height = 0;

    bool operator==(const ImageSize& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const ImageSize& other) const {
        return !(*this == other);
    }

    [[nodiscard]] bool is_valid() const {
        return width > 0 && height > 0;
    }

    /// "WxH" form used in variant keys and logs
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Decoded image, always 4 channels (RGBA, 8 bits each)
 */
struct Bitmap {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; ///< width * height * 4 bytes, row-major

    /// Estimated memory footprint used by the memory cache budget
    [[nodiscard]] size_t byte_size() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    }

    [[nodiscard]] ImageSize size() const {
        return {width, height};
    }
};

using ImagePtr = std::shared_ptr<const Bitmap>;

/**
 * @brief Result of a decode attempt
 */
struct DecodeResult {
    ImagePtr image;    ///< Decoded bitmap (nullptr on failure)
    std::string error; ///< Error message (empty on success)
};

/**
 * @brief Decode encoded image bytes (PNG, JPEG, GIF first frame, BMP, ...)
 *
 * Rejects empty input, inputs larger than 32 MB and images wider or taller
 * than 16384 px.
 */
DecodeResult decode_image(const std::vector<uint8_t>& data);

/**
 * @brief Compute output dimensions that fit within a target box
 *
 * Preserves the aspect ratio; the result never exceeds the target and is at
 * least 1x1. Upscaling is allowed.
 */
ImageSize fit_within(const ImageSize& source, const ImageSize& target);

/**
 * @brief Rescale a bitmap to fit within a target box
 *
 * Returns the source unchanged when it already has the fitted dimensions.
 * Returns nullptr if the source or target is invalid or resizing fails.
 */
ImagePtr scale_to_fit(const ImagePtr& source, const ImageSize& target);

/**
 * @brief Encode a bitmap as JPEG (alpha is composited onto white)
 *
 * @param quality 1..100
 * @param out Receives the encoded bytes
 * @return true on success
 */
bool encode_jpeg(const Bitmap& bitmap, int quality, std::vector<uint8_t>& out);

/**
 * @brief Create a solid-colour bitmap (test patterns, placeholders)
 */
ImagePtr make_solid_bitmap(int width, int height, uint8_t r, uint8_t g, uint8_t b,
                           uint8_t a = 255);

} // namespace thumbkit
