#include "BitPlane.hpp"

#include "core/Errors.hpp"
#include "core/Logging.hpp"

#include <algorithm>

namespace reclaim::bitplane {

namespace {
std::shared_ptr<spdlog::logger> bitPlaneLogger() {
  static auto logger = log::moduleLogger("BitPlane");
  return logger;
}

// Visits the first `count` embedding positions in traversal order
template <typename MatT, typename Fn>
void forEachPosition(MatT &image, size_t count, Fn &&fn) {
  const int channels = image.channels();
  size_t index = 0;
  for (int y = 0; y < image.rows && index < count; ++y) {
    auto *row = image.template ptr<uchar>(y);
    for (int x = 0; x < image.cols && index < count; ++x) {
      for (int c : kEmbedChannels) {
        if (index >= count) {
          break;
        }
        fn(row[x * channels + c], index++);
      }
    }
  }
}
} // namespace

bool isSupported(const cv::Mat &image) noexcept {
  return !image.empty() && image.depth() == CV_8U &&
         (image.channels() == 3 || image.channels() == 4);
}

size_t capacityBits(const cv::Mat &image) noexcept {
  if (!isSupported(image)) {
    return 0;
  }
  return static_cast<size_t>(image.rows) * image.cols * kEmbedChannels.size();
}

void writeBits(cv::Mat &image, const BitSequence &bits) {
  if (!isSupported(image)) {
    throw MalformedInputError("Pixel buffer must be 8-bit BGR or BGRA");
  }

  const size_t capacity = capacityBits(image);
  if (bits.size() > capacity) {
    bitPlaneLogger()->warn("Capacity check failed: {} bits into {}x{} ({})",
                           bits.size(), image.cols, image.rows, capacity);
    throw CapacityExceededError(bits.size(), capacity);
  }

  forEachPosition(image, bits.size(), [&bits](uchar &value, size_t index) {
    value = static_cast<uchar>((value & 0xFE) | (bits[index] ? 1 : 0));
  });

  bitPlaneLogger()->debug("Wrote {} bits into {}x{} image", bits.size(),
                          image.cols, image.rows);
}

BitSequence readBits(const cv::Mat &image, size_t count) {
  const size_t available = std::min(count, capacityBits(image));
  BitSequence bits(available);
  forEachPosition(image, available, [&bits](const uchar &value, size_t index) {
    bits[index] = (value & 1) != 0;
  });
  return bits;
}

cv::Mat lsbPlane(const cv::Mat &image, int channel) {
  CV_Assert(image.depth() == CV_8U && channel >= 0 &&
            channel < image.channels());
  cv::Mat plane(image.size(), CV_8UC1);
  const int channels = image.channels();

  cv::parallel_for_(cv::Range(0, image.rows), [&](const cv::Range &range) {
    for (int y = range.start; y < range.end; ++y) {
      const auto *src = image.ptr<uchar>(y);
      auto *dst = plane.ptr<uchar>(y);
      for (int x = 0; x < image.cols; ++x) {
        dst[x] = (src[x * channels + channel] & 1) ? 255 : 0;
      }
    }
  });
  return plane;
}

} // namespace reclaim::bitplane
