#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "textdet/detection_types.hpp"


namespace textdet
{

namespace utils
{

/**
 * @brief Expand a rotated rectangle outward by area * ratio / perimeter
 * @details Offsetting a rectangle by d keeps it a rectangle, so the result is
 *          the input grown by 2d along both axes. A ratio of 0 returns the
 *          input unchanged.
 */
cv::RotatedRect unclip(const cv::RotatedRect & box, double unclip_ratio);

/**
 * @brief Order the four corners of a text quadrilateral
 * @details The direction of the longer sides decides whether the line is
 *          vertical. Horizontal lines come out as top-left, top-right,
 *          bottom-right, bottom-left. Vertical lines are ordered by their
 *          top pair (left to right) followed by the bottom pair (right to
 *          left), which is the same clockwise walk.
 * @param points Exactly four points
 * @param vertical Receives the direction
 */
std::vector<cv::Point2f> order_quad(const std::vector<cv::Point2f> & points, bool & vertical);

// Sort regions top-to-bottom, then left-to-right; ties by descending score
void sort_regions(std::vector<Region> & regions);

// Clamp every point into [0, width - 1] x [0, height - 1]
void clamp_to_image(std::vector<cv::Point2f> & points, const cv::Size & size);

// Rotate a point of a 90-degree clockwise rotated image back to the source
cv::Point2f unrotate_point(const cv::Point2f & point, const cv::Size & source_size);

// Utility method to print results
void print_detection_results(const DetectionResult & result, size_t max_regions = 20);

// Visualization method to plot regions on image
cv::Mat plot_regions(
  const cv::Mat & image,
  const std::vector<Region> & regions,
  float confidence_threshold = 0.0f);

// Colour-map the probability mask for inspection
cv::Mat render_mask(const cv::Mat & mask);

} // namespace utils

} // namespace textdet
