#include <fstream>
#include <iterator>

// OpenCV includes
#include <opencv2/imgcodecs.hpp>

// Local includes
#include "textdet/exception.hpp"
#include "textdet/image_buffer.hpp"


namespace textdet
{

ImageBuffer::ImageBuffer(cv::Mat pixels)
: pixels_(std::move(pixels))
{
}

ImageBuffer ImageBuffer::from_file(const std::string & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw DecodeError("Failed to open image file: " + path);
  }

  std::vector<uint8_t> bytes(
    (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (bytes.empty()) {
    throw DecodeError("Image file is empty: " + path);
  }

  try {
    return from_bytes(bytes);
  } catch (const DecodeError & e) {
    throw DecodeError(std::string(e.what()) + ": " + path);
  }
}

ImageBuffer ImageBuffer::from_bytes(const std::vector<uint8_t> & bytes)
{
  if (bytes.empty()) {
    throw DecodeError("Cannot decode an empty byte buffer");
  }

  cv::Mat decoded;
  try {
    // IMREAD_UNCHANGED keeps gray and alpha; 16-bit data is rejected below
    decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception & e) {
    throw DecodeError("OpenCV failed to decode image: " + std::string(e.what()));
  }

  if (decoded.empty()) {
    throw DecodeError("Unsupported or corrupt image data");
  }
  return from_mat(decoded);
}

ImageBuffer ImageBuffer::from_raw(int width, int height, int channels, const uint8_t * data)
{
  if (width <= 0 || height <= 0) {
    throw DecodeError("Image dimensions must be positive, got " +
      std::to_string(width) + "x" + std::to_string(height));
  }
  if (channels != 1 && channels != 3 && channels != 4) {
    throw DecodeError("Unsupported channel number: " + std::to_string(channels));
  }
  if (data == nullptr) {
    throw DecodeError("Raw image data is null");
  }

  // Wrap without copying, then clone into owned contiguous storage
  cv::Mat view(height, width, CV_8UC(channels), const_cast<uint8_t *>(data));
  return ImageBuffer(view.clone());
}

ImageBuffer ImageBuffer::from_mat(const cv::Mat & image)
{
  if (image.empty()) {
    throw DecodeError("Input image is empty");
  }
  if (image.depth() != CV_8U) {
    throw DecodeError("Only 8-bit images are supported, got depth " +
      std::to_string(image.depth()));
  }
  const int channels = image.channels();
  if (channels != 1 && channels != 3 && channels != 4) {
    throw DecodeError("Unsupported channel number: " + std::to_string(channels));
  }
  return ImageBuffer(image.clone());
}

} // namespace textdet
