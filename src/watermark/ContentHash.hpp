#pragma once

#include "PayloadCodec.hpp"

#include <array>
#include <opencv2/core.hpp>
#include <string>
#include <string_view>

namespace reclaim::hashing {

using Digest = std::array<uint8_t, 32>;

/**
 * @brief SHA-256 over the raw pixel data of an image.
 *
 * Pixels are serialized row-major as R, G, B, A bytes; images without an
 * alpha channel contribute 255 for A. The result therefore depends on the
 * visual content only, not on the container or its metadata.
 *
 * @throws MalformedInputError for layouts other than 8-bit BGR/BGRA.
 */
Digest fingerprint(const cv::Mat &image);

/**
 * @brief First four bytes of fingerprint().
 */
Fingerprint shortFingerprint(const cv::Mat &image);

std::string fingerprintHex(const cv::Mat &image);
std::string shortFingerprintHex(const cv::Mat &image);

/**
 * @brief Case-insensitive comparison of the first 8 hex characters.
 */
bool fingerprintsMatch(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace reclaim::hashing
