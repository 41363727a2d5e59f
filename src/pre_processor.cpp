#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <string>

// OpenCV includes
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

// Local includes
#include "textdet/exception.hpp"
#include "textdet/pre_processor.hpp"


namespace textdet
{

PreProcessor::PreProcessor(const Config & config)
: config_(config)
{
  if (config_.alignment <= 0 || config_.alignment > config::MAX_SIDE_LEN) {
    throw InvalidOptionsError("PreProcessor alignment must be in [1, " +
      std::to_string(config::MAX_SIDE_LEN) + "], got " + std::to_string(config_.alignment));
  }
  if (config_.bilateral_diameter < 0) {
    throw InvalidOptionsError("PreProcessor bilateral_diameter must be >= 0");
  }
  if (config_.min_side < 0 || config_.min_side > config::MAX_SIDE_LEN) {
    throw InvalidOptionsError("PreProcessor min_side must be in [0, " +
      std::to_string(config::MAX_SIDE_LEN) + "]");
  }
}

PreprocessedInput PreProcessor::process(
  const ImageBuffer & image,
  const PreprocessOptions & options,
  int max_side_len) const
{
  return process(to_bgr(image.mat()), options, max_side_len);
}

PreprocessedInput PreProcessor::process(
  const cv::Mat & bgr,
  const PreprocessOptions & options,
  int max_side_len) const
{
  if (bgr.empty() || bgr.type() != CV_8UC3) {
    throw DecodeError("PreProcessor expects a non-empty 8-bit BGR image");
  }
  check_side_len(max_side_len);

  PreprocessedInput result;
  try {
    cv::Mat padded = resize_and_pad(adjust(bgr, options), max_side_len, result.transform);
    result.tensor = to_tensor(padded);
  } catch (const cv::Exception & e) {
    throw InferenceError("Preprocessing failed: " + std::string(e.what()));
  }
  return result;
}

cv::Mat PreProcessor::adjust(const cv::Mat & bgr, const PreprocessOptions & options) const
{
  cv::Mat adjusted = bgr;
  if (options.invert) {
    adjusted = invert(adjusted);
  }
  if (options.gamma_correct) {
    adjusted = gamma_correct(adjusted);
  }

  if (config_.bilateral_diameter > 0) {
    cv::Mat filtered;
    cv::bilateralFilter(adjusted, filtered, config_.bilateral_diameter, 80.0, 80.0,
      cv::BORDER_DEFAULT);
    adjusted = filtered;
  }
  return adjusted;
}

cv::Mat PreProcessor::to_bgr(const cv::Mat & image)
{
  cv::Mat bgr;
  switch (image.channels()) {
    case 1: cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR); break;
    case 3: bgr = image; break;
    case 4: cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR); break;
    default:
      throw DecodeError("Unsupported channel number: " + std::to_string(image.channels()));
  }
  return bgr;
}

cv::Mat PreProcessor::invert(const cv::Mat & bgr)
{
  cv::Mat inverted;
  cv::bitwise_not(bgr, inverted);
  return inverted;
}

cv::Mat PreProcessor::gamma_correct(const cv::Mat & bgr)
{
  cv::Mat gray;
  cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
  const double mean = cv::mean(gray)[0];

  // Pure black or pure white images have no meaningful gamma
  if (mean < 1.0 || mean > 254.0) {
    return bgr.clone();
  }

  // Choose gamma so that the mean luminance lands on mid-grey
  const double gamma = std::log(0.5) / std::log(mean / 255.0);

  cv::Mat lut(1, 256, CV_8U);
  for (int i = 0; i < 256; ++i) {
    const double corrected = 255.0 * std::pow(i / 255.0, gamma);
    lut.at<uint8_t>(i) = cv::saturate_cast<uint8_t>(std::round(corrected));
  }

  cv::Mat corrected;
  cv::LUT(bgr, lut, corrected);
  return corrected;
}

cv::Size PreProcessor::bordered_size(const cv::Size & image_size) const
{
  if (std::min(image_size.width, image_size.height) >= config_.min_side) {
    return image_size;
  }
  return cv::Size(
    std::max(image_size.width, config_.min_side),
    std::max(image_size.height, config_.min_side));
}

cv::Mat PreProcessor::add_border(const cv::Mat & bgr) const
{
  const cv::Size target = bordered_size(bgr.size());
  if (target == bgr.size()) {
    return bgr;
  }

  cv::Mat bordered;
  cv::copyMakeBorder(bgr, bordered, 0, target.height - bgr.rows, 0, target.width - bgr.cols,
    cv::BORDER_CONSTANT, cv::Scalar::all(config_.pad_value));
  return bordered;
}

cv::Mat PreProcessor::resize_and_pad(
  const cv::Mat & bgr, int max_side_len, ResizeTransform & transform) const
{
  check_side_len(max_side_len);

  const cv::Mat bordered = add_border(bgr);
  const int height = bordered.rows;
  const int width = bordered.cols;
  const double ratio = static_cast<double>(max_side_len) / std::max(height, width);

  const int target_h = std::max(1, static_cast<int>(std::round(height * ratio)));
  const int target_w = std::max(1, static_cast<int>(std::round(width * ratio)));

  cv::Mat resized;
  if (target_h == height && target_w == width) {
    resized = bordered;
  } else {
    cv::resize(bordered, resized, cv::Size(target_w, target_h), 0, 0, cv::INTER_LINEAR);
  }

  // Round up to the alignment; small images get padded rather than cropped
  const int padded_h = align_up(target_h);
  const int padded_w = align_up(target_w);

  cv::Mat padded;
  cv::copyMakeBorder(resized, padded, 0, padded_h - target_h, 0, padded_w - target_w,
    cv::BORDER_CONSTANT, cv::Scalar::all(config_.pad_value));

  transform.original_size = bgr.size();
  transform.bordered_size = bordered.size();
  transform.resized_size = cv::Size(target_w, target_h);
  transform.padded_size = cv::Size(padded_w, padded_h);
  // The long edge defines the scale; rounding of the short edge is ignored
  transform.scale = ratio;

  return padded;
}

bool PreProcessor::should_tile(const cv::Size & image_size, int max_side_len) const
{
  const cv::Size page = bordered_size(image_size);
  const int long_side = std::max(page.width, page.height);
  const int short_side = std::min(page.width, page.height);
  if (short_side <= 0 || max_side_len <= 0) {
    return false;
  }
  return static_cast<double>(long_side) / max_side_len > config::TILE_MIN_DOWNSCALE &&
         static_cast<double>(long_side) / short_side > config::TILE_MIN_ASPECT;
}

TiledInput PreProcessor::tile(
  const cv::Mat & bgr,
  const PreprocessOptions & options,
  int max_side_len) const
{
  if (bgr.empty() || bgr.type() != CV_8UC3) {
    throw DecodeError("PreProcessor expects a non-empty 8-bit BGR image");
  }
  check_side_len(max_side_len);

  TiledInput result;
  TileLayout & layout = result.layout;

  try {
    cv::Mat page = add_border(adjust(bgr, options));
    const cv::Size bordered = page.size();

    // Work on the tall orientation, bands are cut across the long side
    layout.transposed = page.cols > page.rows;
    if (layout.transposed) {
      cv::Mat transposed;
      cv::transpose(page, transposed);
      page = transposed;
    }
    const int page_w = page.cols;
    const int page_h = page.rows;
    layout.page_size = page.size();

    layout.strips_per_tile = std::max(2, (2 * max_side_len) / page_w);
    layout.strip_height = layout.strips_per_tile * page_w;

    const int strips = std::max(1,
        (page_h + layout.strip_height - 1) / layout.strip_height);
    // Spread the bands evenly so that the last one ends on the last row
    const int travel = std::max(0, page_h - layout.strip_height);
    layout.strip_offsets.resize(strips);
    for (int i = 0; i < strips; ++i) {
      layout.strip_offsets[i] = strips > 1 ?
        static_cast<int>(std::lround(static_cast<double>(i) * travel / (strips - 1))) : 0;
    }

    layout.scale = std::min(1.0, static_cast<double>(max_side_len) / layout.strip_height);
    layout.tile_side = std::max(1,
        static_cast<int>(std::lround(layout.strip_height * layout.scale)));
    layout.input_side = align_up(std::max(layout.tile_side, max_side_len));
    layout.map_size = cv::Size(
      std::max(1, static_cast<int>(std::lround(page_w * layout.scale))),
      std::max(1, static_cast<int>(std::lround(page_h * layout.scale))));

    const size_t tiles = layout.tile_count();
    result.tensors.reserve(tiles);
    for (size_t t = 0; t < tiles; ++t) {
      cv::Mat canvas(layout.strip_height, layout.strip_height, CV_8UC3,
        cv::Scalar::all(config_.pad_value));
      for (int j = 0; j < layout.strips_per_tile; ++j) {
        const size_t k = t * layout.strips_per_tile + j;
        if (k >= layout.strip_offsets.size()) {
          break;
        }
        const int top = layout.strip_offsets[k];
        const int rows = std::min(layout.strip_height, page_h - top);
        page(cv::Rect(0, top, page_w, rows)).copyTo(
          canvas(cv::Rect(j * page_w, 0, page_w, rows)));
      }

      // Bands of a wide page go back to running left to right
      if (layout.transposed) {
        cv::Mat transposed;
        cv::transpose(canvas, transposed);
        canvas = transposed;
      }

      cv::Mat scaled;
      if (layout.tile_side == layout.strip_height) {
        scaled = canvas;
      } else {
        cv::resize(canvas, scaled, cv::Size(layout.tile_side, layout.tile_side), 0, 0,
          cv::INTER_LINEAR);
      }

      const int pad = layout.input_side - layout.tile_side;
      cv::Mat padded;
      cv::copyMakeBorder(scaled, padded, 0, pad, 0, pad, cv::BORDER_CONSTANT,
        cv::Scalar::all(config_.pad_value));
      result.tensors.push_back(to_tensor(padded));
    }

    const cv::Size stitched = layout.transposed ?
      cv::Size(layout.map_size.height, layout.map_size.width) : layout.map_size;
    result.transform.original_size = bgr.size();
    result.transform.bordered_size = bordered;
    result.transform.resized_size = stitched;
    result.transform.padded_size = stitched;
    result.transform.scale = layout.scale;
  } catch (const cv::Exception & e) {
    throw InferenceError("Tiling failed: " + std::string(e.what()));
  }

  std::cout << "Page of " << bgr.cols << "x" << bgr.rows << " split into " <<
    result.tensors.size() << " tiles of " << layout.strip_offsets.size() << " bands" << std::endl;
  return result;
}

cv::Mat PreProcessor::stitch(const std::vector<cv::Mat> & maps, const TileLayout & layout)
{
  if (maps.size() != layout.tile_count()) {
    throw InferenceError("Expected " + std::to_string(layout.tile_count()) +
      " tile score maps, got " + std::to_string(maps.size()));
  }

  const int band_w = layout.map_size.width;
  const int band_h = std::max(1, static_cast<int>(std::lround(layout.strip_height * layout.scale)));
  const int map_h = layout.map_size.height;

  try {
    cv::Mat sum = cv::Mat::zeros(layout.map_size, CV_32FC1);
    cv::Mat weight = cv::Mat::zeros(layout.map_size, CV_32FC1);

    for (size_t t = 0; t < maps.size(); ++t) {
      const cv::Mat & map = maps[t];
      if (map.empty() || map.type() != CV_32FC1) {
        throw InferenceError("Tile score map " + std::to_string(t) + " is not CV_32FC1");
      }

      // The map covers the padded tile; keep the scaled content only
      cv::Mat working;
      if (map.rows == layout.input_side && map.cols == layout.input_side) {
        working = map;
      } else {
        cv::resize(map, working, cv::Size(layout.input_side, layout.input_side), 0, 0,
          cv::INTER_LINEAR);
      }
      cv::Mat content = working(cv::Rect(0, 0, layout.tile_side, layout.tile_side));
      if (layout.transposed) {
        cv::Mat transposed;
        cv::transpose(content, transposed);
        content = transposed;
      }

      const cv::Size bands(layout.strips_per_tile * band_w, band_h);
      if (content.size() != bands) {
        cv::Mat resized;
        cv::resize(content, resized, bands, 0, 0, cv::INTER_LINEAR);
        content = resized;
      }

      for (int j = 0; j < layout.strips_per_tile; ++j) {
        const size_t k = t * layout.strips_per_tile + j;
        if (k >= layout.strip_offsets.size()) {
          break;
        }
        const int top = static_cast<int>(std::lround(layout.strip_offsets[k] * layout.scale));
        const int rows = std::min(band_h, map_h - top);
        if (rows <= 0) {
          continue;
        }
        const cv::Rect target(0, top, band_w, rows);
        cv::Mat sum_rows = sum(target);
        cv::Mat weight_rows = weight(target);
        cv::add(sum_rows, content(cv::Rect(j * band_w, 0, band_w, rows)), sum_rows);
        weight_rows += 1.0;
      }
    }

    const cv::Mat covered = cv::max(weight, 1.0);
    cv::Mat stitched;
    cv::divide(sum, covered, stitched);
    if (layout.transposed) {
      cv::Mat transposed;
      cv::transpose(stitched, transposed);
      stitched = transposed;
    }
    return stitched;
  } catch (const cv::Exception & e) {
    throw InferenceError("Stitching tile score maps failed: " + std::string(e.what()));
  }
}

int PreProcessor::align_up(int value) const
{
  const int align = config_.alignment;
  return ((value + align - 1) / align) * align;
}

void PreProcessor::check_side_len(int max_side_len)
{
  if (max_side_len <= 0 || max_side_len > config::MAX_SIDE_LEN) {
    throw InvalidOptionsError("max_side_len must be in [1, " +
      std::to_string(config::MAX_SIDE_LEN) + "], got " + std::to_string(max_side_len));
  }
}

Tensor PreProcessor::to_tensor(const cv::Mat & padded) const
{
  // blobFromImage computes (pixel - mean) * scale and reorders HWC to NCHW
  const cv::Scalar mean(config_.mean[0], config_.mean[1], config_.mean[2]);
  cv::Mat blob = cv::dnn::blobFromImage(padded, config_.scale, padded.size(), mean,
    config_.swap_rb, false, CV_32F);

  Tensor tensor;
  tensor.shape = {1, 3, padded.rows, padded.cols};
  tensor.data.resize(tensor.element_count());
  std::memcpy(tensor.data.data(), blob.ptr<float>(), tensor.data.size() * sizeof(float));
  return tensor;
}

} // namespace textdet
