#include <algorithm>
#include <cmath>
#include <string>

// OpenCV includes
#include <opencv2/imgproc.hpp>

// Local includes
#include "textdet/config.hpp"
#include "textdet/detection_utils.hpp"
#include "textdet/exception.hpp"
#include "textdet/post_processor.hpp"


namespace textdet
{

std::vector<Region> DBPostProcessor::decode(
  const cv::Mat & probability,
  const ResizeTransform & transform,
  const DecodeOptions & options) const
{
  std::vector<Region> regions;
  if (probability.empty()) {
    return regions;
  }

  try {
    // The score map may be smaller than the network input (strided heads)
    const double fx = static_cast<double>(transform.padded_size.width) / probability.cols;
    const double fy = static_cast<double>(transform.padded_size.height) / probability.rows;

    for (const auto & candidate : extract_candidates(probability, options)) {
      std::vector<cv::Point2f> points;
      points.reserve(candidate.points.size());
      for (const auto & p : candidate.points) {
        const cv::Point2f working(static_cast<float>(p.x * fx), static_cast<float>(p.y * fy));
        points.push_back(transform.to_original(working));
      }
      utils::clamp_to_image(points, transform.original_size);

      // Clamping can fold points onto the border; the hull keeps the polygon simple
      std::vector<cv::Point2f> hull;
      cv::convexHull(points, hull, false, true);
      if (hull.size() < 3) {
        continue;
      }

      Region region;
      region.score = candidate.score;
      if (hull.size() == 4) {
        region.polygon = utils::order_quad(hull, region.vertical);
      } else {
        // Start at the corner closest to the origin, keep the clockwise walk
        auto first = std::min_element(hull.begin(), hull.end(),
          [](const cv::Point2f & a, const cv::Point2f & b) {
            return a.x + a.y < b.x + b.y;
          });
        std::rotate(hull.begin(), first, hull.end());
        region.polygon = hull;
        const cv::Rect2f bounds = region.bounding_box();
        region.vertical = bounds.height > bounds.width;
      }

      if (region.area() < config::MIN_REGION_AREA) {
        continue;
      }
      regions.push_back(std::move(region));
    }
  } catch (const cv::Exception & e) {
    throw InferenceError("Score map decode failed: " + std::string(e.what()));
  }

  utils::sort_regions(regions);
  return regions;
}

std::vector<Candidate> DBPostProcessor::extract_candidates(
  const cv::Mat & probability,
  const DecodeOptions & options) const
{
  std::vector<Candidate> candidates;

  try {
    cv::Mat bitmap;
    cv::threshold(probability, bitmap, options.mask_threshold, 255.0, cv::THRESH_BINARY);
    bitmap.convertTo(bitmap, CV_8U);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(bitmap, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);

    const size_t num_contours = std::min(contours.size(), options.max_candidates);
    candidates.reserve(num_contours);

    for (size_t i = 0; i < num_contours; ++i) {
      const auto & contour = contours[i];

      cv::RotatedRect box = cv::minAreaRect(contour);
      if (std::min(box.size.width, box.size.height) < options.min_box_side) {
        continue;
      }

      const float score = contour_score(probability, contour);
      if (score < options.box_score_threshold) {
        continue;
      }

      if (options.unclip_ratio > 0.0) {
        box = utils::unclip(box, options.unclip_ratio);
        if (std::min(box.size.width, box.size.height) < options.min_box_side + 2.0) {
          continue;
        }
      }

      Candidate candidate;
      candidate.points.resize(4);
      box.points(candidate.points.data());
      candidate.score = score;
      candidates.push_back(std::move(candidate));
    }
  } catch (const cv::Exception & e) {
    throw InferenceError("Contour extraction failed: " + std::string(e.what()));
  }

  return candidates;
}

float DBPostProcessor::contour_score(
  const cv::Mat & probability, const std::vector<cv::Point> & contour)
{
  const cv::Rect bounds = cv::boundingRect(contour) & cv::Rect(0, 0, probability.cols,
    probability.rows);
  if (bounds.empty()) {
    return 0.0f;
  }

  cv::Mat mask = cv::Mat::zeros(bounds.size(), CV_8UC1);
  std::vector<std::vector<cv::Point>> shifted(1);
  shifted[0].reserve(contour.size());
  for (const auto & p : contour) {
    shifted[0].emplace_back(p.x - bounds.x, p.y - bounds.y);
  }
  cv::fillPoly(mask, shifted, cv::Scalar(1));

  return static_cast<float>(cv::mean(probability(bounds), mask)[0]);
}

cv::Mat DBPostProcessor::restore_mask(const cv::Mat & map, const ResizeTransform & transform)
{
  if (map.empty()) {
    return cv::Mat();
  }

  try {
    cv::Mat working;
    if (map.size() == transform.padded_size) {
      working = map;
    } else {
      cv::resize(map, working, transform.padded_size, 0, 0, cv::INTER_LINEAR);
    }

    // Drop the alignment padding and the minimum-side border
    const cv::Mat content = working(cv::Rect(cv::Point(0, 0), transform.content_size()));

    cv::Mat restored;
    if (content.size() == transform.original_size) {
      restored = content.clone();
    } else {
      cv::resize(content, restored, transform.original_size, 0, 0, cv::INTER_LINEAR);
    }
    return restored;
  } catch (const cv::Exception & e) {
    throw InferenceError("Mask restoration failed: " + std::string(e.what()));
  }
}

cv::Mat DBPostProcessor::tensor_to_map(const Tensor & tensor, bool apply_sigmoid)
{
  const auto & shape = tensor.shape;
  if (shape.size() < 2 || shape.size() > 4) {
    throw InferenceError("Score map must have 2 to 4 dimensions, got " +
      std::to_string(shape.size()));
  }
  if (tensor.data.size() != tensor.element_count()) {
    throw InferenceError("Score map data does not match its shape");
  }

  const int height = static_cast<int>(shape[shape.size() - 2]);
  const int width = static_cast<int>(shape[shape.size() - 1]);
  if (height <= 0 || width <= 0) {
    throw InferenceError("Score map has an empty spatial extent");
  }
  if (shape.size() == 4 && shape[0] != 1) {
    throw InferenceError("Batched score maps are not supported");
  }

  // Multi-channel heads (e.g. shrink + threshold maps) keep channel 0
  const float * first = tensor.data.data();
  cv::Mat map = cv::Mat(height, width, CV_32FC1, const_cast<float *>(first)).clone();

  if (apply_sigmoid) {
    cv::Mat negated;
    cv::exp(-map, negated);
    map = 1.0 / (1.0 + negated);
  }
  return map;
}

} // namespace textdet
