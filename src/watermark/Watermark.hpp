#pragma once

#include "PayloadCodec.hpp"
#include "image/ImageIO.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <string>

namespace reclaim::watermark {

struct EmbedResult {
  Bytes png;              ///< Lossless watermarked image
  WatermarkRecord record; ///< Record that was embedded
};

/**
 * @brief Builds a record for @p image, fingerprinting its current pixels.
 */
WatermarkRecord makeRecord(const cv::Mat &image, std::string creatorId,
                           SourceType sourceType, uint32_t timestamp);

/**
 * @brief Embeds @p record into @p image in place.
 *
 * The image is left untouched when an exception is thrown.
 *
 * @throws CapacityExceededError if the image is too small for the record.
 * @throws InvalidRecordError if the record cannot be encoded.
 * @throws MalformedInputError if the pixel layout is unsupported.
 */
void embedInPlace(cv::Mat &image, const WatermarkRecord &record);

/**
 * @brief Returns a watermarked copy of @p image.
 */
cv::Mat embed(const cv::Mat &image, const WatermarkRecord &record);

/**
 * @brief Reads a record from @p image; std::nullopt when none is present.
 */
std::optional<WatermarkRecord> extract(const cv::Mat &image);

bool hasWatermark(const cv::Mat &image);

/**
 * @brief Decodes an encoded image, embeds @p record and re-encodes as PNG.
 * @throws MalformedInputError if the bytes are not a decodable image.
 */
EmbedResult embedEncoded(const Bytes &imageBytes, const WatermarkRecord &record);

/**
 * @brief Same as above, computing the content fingerprint from the decoded
 * pixels unless @p fingerprint is supplied.
 */
EmbedResult embedEncoded(const Bytes &imageBytes, std::string creatorId,
                         SourceType sourceType, uint32_t timestamp,
                         std::optional<Fingerprint> fingerprint = std::nullopt);

/**
 * @brief Decodes an encoded image and extracts its record.
 * @throws MalformedInputError if the bytes are not a decodable image.
 */
std::optional<WatermarkRecord> extractEncoded(const Bytes &imageBytes);

/**
 * @brief Smallest square side length (in pixels) able to carry a record
 * whose creatorId is @p creatorIdBytes long.
 */
int minimumSquareDimension(size_t creatorIdBytes) noexcept;

/**
 * @brief Decodes bytes into a pixel buffer or throws MalformedInputError.
 */
cv::Mat decodeOrThrow(const Bytes &imageBytes);

} // namespace reclaim::watermark
