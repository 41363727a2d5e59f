#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <string>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>


namespace textdet
{
/**
 * @brief Geometry of the border, resize and pad steps
 * @details Working coordinates are those of the padded network input. The
 *          border and the padding are both added on the right and bottom
 *          only, so the image content starts at the working origin and
 *          there is no offset. The content covers content_size() pixels of
 *          the working image, the rest is border or padding.
 */
struct ResizeTransform
{
  cv::Size original_size;   ///< Size of the image handed to the network stage
  cv::Size bordered_size;   ///< Size after the minimum-side border
  cv::Size resized_size;    ///< Size after the aspect preserving resize
  cv::Size padded_size;     ///< Size of the network input
  double scale = 1.0;       ///< resized / bordered

  int pad_right() const noexcept { return padded_size.width - resized_size.width; }
  int pad_bottom() const noexcept { return padded_size.height - resized_size.height; }

  // Extent of the original image in working coordinates
  cv::Size content_size() const;

  // Map a working (padded input) point to original image coordinates
  cv::Point2f to_original(const cv::Point2f & working) const
  {
    return {static_cast<float>(working.x / scale), static_cast<float>(working.y / scale)};
  }

  // Map an original image point to working coordinates
  cv::Point2f to_working(const cv::Point2f & original) const
  {
    return {static_cast<float>(original.x * scale), static_cast<float>(original.y * scale)};
  }
};

/**
 * @brief One detected text region
 * @details Points are in original image coordinates, ordered clockwise
 *          starting at the top-left corner of the text line.
 */
struct Region
{
  std::vector<cv::Point2f> polygon;
  float score = 0.0f;     ///< Mean probability inside the detected component
  bool vertical = false;  ///< Text line runs top to bottom

  // Axis aligned bounds of the polygon
  cv::Rect2f bounding_box() const;

  // Area of the polygon's convex hull
  double area() const;

  // Length along the text direction divided by the length across it
  double aspect_ratio() const;
};

/**
 * @brief Output of one detect() call
 * @details mask and auxiliary_mask are CV_32FC1 in [0, 1] and sized like the
 *          input image; transform exposes the working resolution geometry
 *          for callers that need it.
 */
struct DetectionResult
{
  std::vector<Region> regions;  ///< Sorted top-to-bottom, then left-to-right
  cv::Mat mask;                 ///< Text probability per input pixel
  cv::Mat auxiliary_mask;       ///< Second model output, empty if absent
  ResizeTransform transform;    ///< Resize/pad geometry used for this call
  std::string provider;         ///< Accelerator that served the inference
};

} // namespace textdet
