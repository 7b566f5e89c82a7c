#pragma once

#include "PayloadCodec.hpp"

#include <array>
#include <opencv2/core.hpp>

namespace reclaim::bitplane {

/// Channel indices (OpenCV BGR order) that carry payload bits, in traversal
/// order. Red and alpha are never touched.
constexpr std::array<int, 2> kEmbedChannels = {0 /* blue */, 1 /* green */};

/**
 * @brief Checks that an image uses a layout the engine can address
 * (8-bit, 3 or 4 channels).
 */
bool isSupported(const cv::Mat &image) noexcept;

/**
 * @brief Number of payload bits the image can carry: one per usable channel
 * byte. Returns 0 for unsupported layouts.
 */
size_t capacityBits(const cv::Mat &image) noexcept;

/**
 * @brief Writes @p bits into the least significant bits of the image.
 *
 * Traversal is row-major, then column, then kEmbedChannels. Capacity is
 * checked before any pixel is modified.
 *
 * @throws CapacityExceededError if bits.size() > capacityBits(image).
 * @throws MalformedInputError if the image layout is unsupported.
 */
void writeBits(cv::Mat &image, const BitSequence &bits);

/**
 * @brief Reads the least significant bits of the first @p count positions
 * in traversal order. The result is truncated to the image capacity.
 */
BitSequence readBits(const cv::Mat &image, size_t count);

/**
 * @brief Visualizes the LSB plane of one channel (0 -> black, 1 -> white).
 */
cv::Mat lsbPlane(const cv::Mat &image, int channel);

} // namespace reclaim::bitplane
