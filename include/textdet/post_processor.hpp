#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "textdet/detection_types.hpp"
#include "textdet/options.hpp"
#include "textdet/tensor.hpp"


namespace textdet
{
/**
 * @brief Candidate box in probability map coordinates
 */
struct Candidate
{
  std::vector<cv::Point2f> points;  ///< Convex polygon after unclipping
  float score = 0.0f;
};

/**
 * @brief Differentiable-binarization (DB) decoder
 * @details Converts the score map of a DBNet-style network into scored
 *          polygons in original image coordinates.
 */
class DBPostProcessor
{
public:
  /**
   * @brief Main postprocessing method
   * @param probability Score map in [0, 1], CV_32FC1, any resolution
   *        proportional to the padded network input
   * @param transform Resize transform recorded by the pre-processor
   * @param options Thresholds and expansion ratio
   * @return Regions in original image coordinates, sorted top-to-bottom then
   *         left-to-right
   */
  std::vector<Region> decode(
    const cv::Mat & probability,
    const ResizeTransform & transform,
    const DecodeOptions & options) const;

  /**
   * @brief Extract scored, unclipped boxes from a score map
   * @details Works entirely in probability map coordinates.
   */
  std::vector<Candidate> extract_candidates(
    const cv::Mat & probability,
    const DecodeOptions & options) const;

  /**
   * @brief Bring a score map back to the original image resolution
   * @details The map is resized to the padded input size, the padding and
   *          the minimum-side border are cropped and the content resized to
   *          transform.original_size.
   * @throws InferenceError if OpenCV rejects the geometry
   */
  static cv::Mat restore_mask(const cv::Mat & map, const ResizeTransform & transform);

  /**
   * @brief View a [1, 1, H, W] or [1, H, W] tensor as a CV_32FC1 map
   * @param apply_sigmoid Convert logits to probabilities
   * @throws InferenceError if the tensor is not a single 2-D map
   */
  static cv::Mat tensor_to_map(const Tensor & tensor, bool apply_sigmoid);

  // Mean of the score map inside a contour polygon
  static float contour_score(const cv::Mat & probability, const std::vector<cv::Point> & contour);
};

} // namespace textdet
