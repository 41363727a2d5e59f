#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstdint>
#include <string>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>


namespace textdet
{
/**
 * @brief Decoded 8-bit image with known geometry
 * @details Pixels are stored contiguously, colour images in BGR(A) order.
 *          Every accessor is const, but the pixels are reference counted:
 *          copies of an ImageBuffer, and cv::Mat copies of mat(), share one
 *          storage. Immutability therefore holds only as long as nobody
 *          writes through such a copy. Use clone_mat() to get pixels that
 *          may be modified.
 */
class ImageBuffer
{
public:
  /**
   * @brief Decode an image file (PNG, JPEG, ... as supported by OpenCV)
   * @throws DecodeError if the file is missing, corrupt or unsupported
   */
  static ImageBuffer from_file(const std::string & path);

  /**
   * @brief Decode an encoded image held in memory
   * @throws DecodeError if the bytes cannot be decoded
   */
  static ImageBuffer from_bytes(const std::vector<uint8_t> & bytes);

  /**
   * @brief Copy a raw interleaved pixel array
   * @param width Image width in pixels, > 0
   * @param height Image height in pixels, > 0
   * @param channels 1 (gray), 3 (BGR) or 4 (BGRA)
   * @param data width * height * channels bytes, row-major
   * @throws DecodeError if the geometry is invalid or data is null
   */
  static ImageBuffer from_raw(int width, int height, int channels, const uint8_t * data);

  /**
   * @brief Deep-copy an existing OpenCV matrix (CV_8UC1, CV_8UC3 or CV_8UC4)
   * @throws DecodeError for empty matrices or other element types
   */
  static ImageBuffer from_mat(const cv::Mat & image);

  int width() const noexcept { return pixels_.cols; }
  int height() const noexcept { return pixels_.rows; }
  int channels() const noexcept { return pixels_.channels(); }
  cv::Size size() const noexcept { return pixels_.size(); }

  // Number of bytes in the pixel storage: width * height * channels
  size_t byte_size() const noexcept { return pixels_.total() * pixels_.elemSize(); }

  const uint8_t * data() const noexcept { return pixels_.ptr<uint8_t>(); }

  // Read-only view sharing the buffer's storage; callers must not write through it
  const cv::Mat & mat() const noexcept { return pixels_; }

  // Deep copy of the pixels, free to modify
  cv::Mat clone_mat() const { return pixels_.clone(); }

private:
  explicit ImageBuffer(cv::Mat pixels);

  cv::Mat pixels_;
};

} // namespace textdet
