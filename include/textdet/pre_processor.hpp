#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <array>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "textdet/config.hpp"
#include "textdet/detection_types.hpp"
#include "textdet/image_buffer.hpp"
#include "textdet/options.hpp"
#include "textdet/tensor.hpp"


namespace textdet
{
/**
 * @brief Network input produced from one image
 */
struct PreprocessedInput
{
  Tensor tensor;              ///< [1, 3, padded_h, padded_w]
  ResizeTransform transform;  ///< Geometry needed to map outputs back
};

/**
 * @brief Placement of the strips of a tiled page
 * @details A page much longer than it is wide is handled in its tall
 *          orientation (transposed first when it is wider than tall). It is
 *          cut into overlapping bands one page wide and strip_height rows
 *          high, and strips_per_tile bands are laid side by side to fill each
 *          square tile. Every tile is scaled by the same factor and fed to
 *          the network on its own.
 */
struct TileLayout
{
  bool transposed = false;         ///< Page was wider than tall
  cv::Size page_size;              ///< Bordered page in tall orientation
  int strips_per_tile = 0;         ///< Bands placed side by side in one tile
  int strip_height = 0;            ///< Rows per band, also the tile side
  std::vector<int> strip_offsets;  ///< First page row of each band
  double scale = 1.0;              ///< Network pixels per page pixel
  int tile_side = 0;               ///< Tile side after scaling
  int input_side = 0;              ///< Tile side after padding to the alignment
  cv::Size map_size;               ///< Stitched map in tall orientation

  size_t tile_count() const
  {
    return strips_per_tile > 0 ?
           (strip_offsets.size() + strips_per_tile - 1) / strips_per_tile : 0;
  }
};

/**
 * @brief Network inputs produced from one tiled page
 */
struct TiledInput
{
  std::vector<Tensor> tensors;  ///< One [1, 3, input_side, input_side] per tile
  TileLayout layout;            ///< Where each band goes back on the page
  ResizeTransform transform;    ///< Geometry of the stitched score map
};

class PreProcessor
{
public:
  struct Config
  {
    /**
     * @brief Per-channel mean subtracted before scaling (BGR order)
     */
    std::array<float, 3> mean;

    /**
     * @brief Multiplier applied after mean subtraction
     */
    float scale;

    /**
     * @brief Feed the network RGB instead of BGR
     */
    bool swap_rb;

    /**
     * @brief Multiple the padded height and width are rounded up to
     * @details A Detector replaces it with its ModelArtifact::input_alignment.
     */
    int alignment;

    /**
     * @brief Pixel value of the padded border
     */
    int pad_value;

    /**
     * @brief Diameter of the edge-preserving bilateral filter
     * @details Smooths paper texture and JPEG noise without blurring glyph
     *          edges. Set to 0 to disable.
     */
    int bilateral_diameter;

    /**
     * @brief Shorter side below which the image gets a border
     * @details The image is extended on the right and bottom with pad_value
     *          until both sides reach min_side, then resized as a whole.
     *          The border is removed again from the returned mask. Set to 0
     *          to disable.
     */
    int min_side;

    /**
     * @brief Default constructor
     * @details Initializes the configuration with default values.
     */
    Config()
    : mean(config::MEAN), scale(config::SCALE), swap_rb(true),
      alignment(config::INPUT_ALIGNMENT), pad_value(config::PAD_VALUE),
      bilateral_diameter(17), min_side(config::MIN_INPUT_SIDE) {}
  };

  explicit PreProcessor(const Config & config = Config());

  /**
   * @brief Build the network input for one image
   * @param image Source image, left untouched
   * @param options Colour adjustments (invert, gamma); rotation is handled
   *        by the detector
   * @param max_side_len Target length of the longer edge
   * @return Normalized NCHW tensor and the resize transform
   */
  PreprocessedInput process(
    const ImageBuffer & image,
    const PreprocessOptions & options,
    int max_side_len) const;

  /**
   * @brief Same as process() for a BGR matrix already owned by the caller
   */
  PreprocessedInput process(
    const cv::Mat & bgr,
    const PreprocessOptions & options,
    int max_side_len) const;

  // Colour adjustments, exposed for testing
  static cv::Mat to_bgr(const cv::Mat & image);
  static cv::Mat invert(const cv::Mat & bgr);
  static cv::Mat gamma_correct(const cv::Mat & bgr);

  // Size of an image after the minimum-side border
  cv::Size bordered_size(const cv::Size & image_size) const;

  /**
   * @brief Extend the image on the right and bottom up to config().min_side
   * @return The input itself when both sides are already long enough
   */
  cv::Mat add_border(const cv::Mat & bgr) const;

  /**
   * @brief Border, aspect preserving resize, then right/bottom padding
   * @param bgr Source image
   * @param max_side_len Target length of the longer edge of the bordered image
   * @param transform Receives the geometry of the operation
   * @return Padded image of transform.padded_size
   */
  cv::Mat resize_and_pad(const cv::Mat & bgr, int max_side_len, ResizeTransform & transform) const;

  /**
   * @brief Whether a page is too elongated for a single resize
   * @details True when the long side of the bordered page is more than 2.5
   *          times max_side_len and more than 3 times its short side. A
   *          single resize would shrink the text of such pages beyond
   *          recognition.
   */
  bool should_tile(const cv::Size & image_size, int max_side_len) const;

  /**
   * @brief Cut an elongated page into square network inputs
   * @param bgr Source page, left untouched
   * @param options Colour adjustments, as for process()
   * @param max_side_len Side every tile is scaled down to
   * @return One tensor per tile plus the layout needed by stitch()
   */
  TiledInput tile(
    const cv::Mat & bgr,
    const PreprocessOptions & options,
    int max_side_len) const;

  /**
   * @brief Reassemble per-tile score maps into one map of the page
   * @param maps One CV_32FC1 map per tile, in tile order, of any resolution
   * @param layout Layout returned by tile()
   * @return Map of size transform.padded_size of the matching TiledInput.
   *         Rows covered by two bands hold their average.
   * @throws InferenceError if the maps do not match the layout
   */
  static cv::Mat stitch(const std::vector<cv::Mat> & maps, const TileLayout & layout);

  const Config & config() const noexcept { return config_; }

private:
  Config config_;

  // Invert, gamma and bilateral filter as requested
  cv::Mat adjust(const cv::Mat & bgr, const PreprocessOptions & options) const;

  int align_up(int value) const;
  static void check_side_len(int max_side_len);

  Tensor to_tensor(const cv::Mat & padded) const;
};

} // namespace textdet
