#include "ImageIO.hpp"

#include "core/Logging.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace reclaim {

namespace {
std::shared_ptr<spdlog::logger> imageIOLogger() {
  static auto logger = log::moduleLogger("ImageIO");
  return logger;
}

// Brings any decoded Mat to CV_8UC3 / CV_8UC4
cv::Mat normalizeLayout(const cv::Mat &decoded) {
  cv::Mat eightBit;
  switch (decoded.depth()) {
  case CV_8U:
    eightBit = decoded;
    break;
  case CV_16U:
    decoded.convertTo(eightBit, CV_8U, 1.0 / 257.0);
    break;
  default:
    cv::normalize(decoded, eightBit, 0, 255, cv::NORM_MINMAX, CV_8U);
    break;
  }

  cv::Mat result;
  switch (eightBit.channels()) {
  case 1:
    cv::cvtColor(eightBit, result, cv::COLOR_GRAY2BGR);
    break;
  case 3:
  case 4:
    result = eightBit;
    break;
  default:
    return cv::Mat();
  }
  return result;
}
} // namespace

auto decodeImage(const Bytes &data) noexcept
    -> std::expected<cv::Mat, ImageIOError> {
  if (data.empty()) {
    imageIOLogger()->warn("Refusing to decode an empty buffer");
    return std::unexpected(ImageIOError::EmptyImage);
  }

  try {
    cv::Mat decoded = cv::imdecode(data, cv::IMREAD_UNCHANGED);
    if (decoded.empty()) {
      imageIOLogger()->warn("Buffer of {} bytes is not a decodable image",
                            data.size());
      return std::unexpected(ImageIOError::InvalidFormat);
    }

    cv::Mat image = normalizeLayout(decoded);
    if (image.empty()) {
      imageIOLogger()->warn("Unsupported channel count: {}",
                            decoded.channels());
      return std::unexpected(ImageIOError::UnsupportedFormat);
    }

    imageIOLogger()->debug("Decoded image: {}x{}, {} channels", image.cols,
                           image.rows, image.channels());
    return image;
  } catch (const cv::Exception &e) {
    imageIOLogger()->error("OpenCV exception in decodeImage: {}", e.what());
    return std::unexpected(ImageIOError::InvalidFormat);
  }
}

auto encodeImage(const cv::Mat &image, ImageFormat format, int quality) noexcept
    -> std::expected<Bytes, ImageIOError> {
  if (image.empty()) {
    imageIOLogger()->error("Cannot encode empty image");
    return std::unexpected(ImageIOError::EmptyImage);
  }

  try {
    std::vector<int> params;
    const char *ext = ".png";
    if (format == ImageFormat::Jpeg) {
      ext = ".jpg";
      params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 0, 100)};
    } else {
      params = {cv::IMWRITE_PNG_COMPRESSION, 6};
    }

    Bytes encoded;
    if (!cv::imencode(ext, image, encoded, params)) {
      imageIOLogger()->error("Failed to encode {}x{} image as {}", image.cols,
                             image.rows, ext);
      return std::unexpected(ImageIOError::WriteError);
    }
    return encoded;
  } catch (const cv::Exception &e) {
    imageIOLogger()->error("OpenCV exception in encodeImage: {}", e.what());
    return std::unexpected(ImageIOError::WriteError);
  }
}

auto readFileBytes(const fs::path &path) noexcept
    -> std::expected<Bytes, ImageIOError> {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    imageIOLogger()->error("Cannot open file: {}", path.string());
    return std::unexpected(ImageIOError::ReadError);
  }
  Bytes data((std::istreambuf_iterator<char>(file)),
             std::istreambuf_iterator<char>());
  if (file.bad()) {
    imageIOLogger()->error("Read failed: {}", path.string());
    return std::unexpected(ImageIOError::ReadError);
  }
  return data;
}

auto writeFileBytes(const fs::path &path, const Bytes &data) noexcept
    -> std::expected<void, ImageIOError> {
  std::error_code ec;
  const auto parent = path.parent_path();
  if (!parent.empty() && !fs::exists(parent, ec)) {
    if (!fs::create_directories(parent, ec) || ec) {
      imageIOLogger()->error("Failed to create directory: {} - {}",
                             parent.string(), ec.message());
      return std::unexpected(ImageIOError::WriteError);
    }
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    imageIOLogger()->error("Cannot open file for writing: {}", path.string());
    return std::unexpected(ImageIOError::WriteError);
  }
  file.write(reinterpret_cast<const char *>(data.data()),
             static_cast<std::streamsize>(data.size()));
  if (!file) {
    imageIOLogger()->error("Write failed: {}", path.string());
    return std::unexpected(ImageIOError::WriteError);
  }
  return {};
}

} // namespace reclaim
