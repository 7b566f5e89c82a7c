#pragma once

#include "core/Errors.hpp"

#include <expected>
#include <filesystem>
#include <opencv2/core.hpp>
#include <vector>

namespace fs = std::filesystem;

namespace reclaim {

using Bytes = std::vector<uchar>;

// Container formats the engine writes
enum class ImageFormat {
  Png, ///< Lossless, the only format used for watermarked output
  Jpeg ///< Lossy, destroys LSB payloads
};

/**
 * @brief Decodes an encoded image into an 8-bit BGR or BGRA pixel buffer.
 *
 * Grey images are expanded to BGR and deeper images are scaled to 8 bits so
 * every caller sees the same channel layout regardless of the container.
 *
 * @param data Encoded image bytes (PNG, JPEG, BMP, ...).
 * @return The decoded image or the reason it could not be decoded.
 */
auto decodeImage(const Bytes &data) noexcept
    -> std::expected<cv::Mat, ImageIOError>;

/**
 * @brief Encodes a pixel buffer.
 * @param image The image to encode.
 * @param format Target container.
 * @param quality JPEG quality (0-100), ignored for PNG.
 * @return The encoded bytes or a write error.
 */
auto encodeImage(const cv::Mat &image, ImageFormat format = ImageFormat::Png,
                 int quality = 95) noexcept
    -> std::expected<Bytes, ImageIOError>;

/**
 * @brief Reads a whole file into memory.
 */
auto readFileBytes(const fs::path &path) noexcept
    -> std::expected<Bytes, ImageIOError>;

/**
 * @brief Writes bytes to a file, creating the parent directory if needed.
 */
auto writeFileBytes(const fs::path &path, const Bytes &data) noexcept
    -> std::expected<void, ImageIOError>;

} // namespace reclaim
