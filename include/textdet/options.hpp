#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstddef>


namespace textdet
{
/**
 * @brief Image adjustments applied before inference
 * @details Passed by value into every detect() call, no state is kept
 *          between calls.
 */
struct PreprocessOptions
{
  /**
   * @brief Invert the image colours for detection
   * @details Helps with light text on a dark background.
   */
  bool invert = false;

  /**
   * @brief Gamma-correct the image so its mean luminance becomes mid-grey
   */
  bool gamma_correct = false;

  /**
   * @brief Rotate the image 90 degrees clockwise for detection
   * @details Regions and mask are rotated back, outputs stay in input
   *          image coordinates.
   */
  bool rotate = false;

  /**
   * @brief Re-run the detection rotated when most regions come out vertical
   * @details Ignored when rotate is already set.
   */
  bool auto_rotate = false;
};

/**
 * @brief Thresholds and geometry parameters of the probability map decode
 */
struct DecodeOptions
{
  /**
   * @brief Length the longer image edge is resized to before inference
   * @details Must be in [32, 8192] (config::MAX_SIDE_LEN). Smaller images are
   *          upscaled, larger ones downscaled, the aspect ratio is kept.
   *          Pages far longer than max_side_len are tiled instead, each tile
   *          being max_side_len square.
   */
  int max_side_len = 2048;

  /**
   * @brief How far the shrunk text kernels are expanded back outward
   * @details The expansion distance is area * unclip_ratio / perimeter.
   *          Must be >= 0, 0 returns the raw contour rectangles.
   *          - 1.0 - 1.5: tight layouts, well separated lines
   *          - 1.5 - 2.0: general purpose
   *          - 2.0 - 2.5: thin or faint text
   */
  double unclip_ratio = 2.3;

  /**
   * @brief Minimum mean probability of a region, in [0, 1]
   */
  double box_score_threshold = 0.7;

  /**
   * @brief Probability above which a pixel counts as text, in [0, 1]
   */
  double mask_threshold = 0.5;

  /**
   * @brief Minimum short side (probability map pixels) of a candidate box
   */
  double min_box_side = 3.0;

  /**
   * @brief Maximum number of contours examined per image
   */
  size_t max_candidates = 1000;

  /**
   * @brief Check every field against its documented range
   * @throws InvalidOptionsError naming the first offending field
   */
  void validate() const;
};

} // namespace textdet
