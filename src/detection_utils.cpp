#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

// Local includes
#include "textdet/detection_utils.hpp"


namespace textdet
{

namespace utils
{

cv::RotatedRect unclip(const cv::RotatedRect & box, double unclip_ratio)
{
  const double width = box.size.width;
  const double height = box.size.height;
  const double perimeter = 2.0 * (width + height);
  if (unclip_ratio <= 0.0 || perimeter <= 0.0) {
    return box;
  }

  const double distance = width * height * unclip_ratio / perimeter;
  return cv::RotatedRect(
    box.center,
    cv::Size2f(static_cast<float>(width + 2.0 * distance),
    static_cast<float>(height + 2.0 * distance)),
    box.angle);
}

std::vector<cv::Point2f> order_quad(const std::vector<cv::Point2f> & points, bool & vertical)
{
  if (points.size() != 4) {
    throw std::invalid_argument("order_quad expects 4 points, got " +
      std::to_string(points.size()));
  }

  // Points walk the quad in order, so edges i and i + 2 are opposite sides
  auto edge = [&points](size_t i) {
      return points[(i + 1) % 4] - points[i];
    };
  auto length = [](const cv::Point2f & v) {
      return std::hypot(v.x, v.y);
    };

  const bool first_pair_longer =
    length(edge(0)) + length(edge(2)) >= length(edge(1)) + length(edge(3));
  const size_t a = first_pair_longer ? 0 : 1;

  // Opposite edges point in opposite directions
  const cv::Point2f direction = (edge(a) - edge(a + 2)) * 0.5f;
  vertical = std::abs(direction.x) <= std::abs(direction.y);

  std::vector<cv::Point2f> sorted = points;
  auto by_x = [](const cv::Point2f & l, const cv::Point2f & r) {return l.x < r.x;};
  auto by_y = [](const cv::Point2f & l, const cv::Point2f & r) {return l.y < r.y;};

  if (vertical) {
    std::stable_sort(sorted.begin(), sorted.end(), by_y);
    std::stable_sort(sorted.begin(), sorted.begin() + 2, by_x);
    std::stable_sort(sorted.begin() + 2, sorted.end(), by_x);
    return {sorted[0], sorted[1], sorted[3], sorted[2]};
  }

  std::stable_sort(sorted.begin(), sorted.end(), by_x);
  std::stable_sort(sorted.begin(), sorted.begin() + 2, by_y);
  std::stable_sort(sorted.begin() + 2, sorted.end(), by_y);
  return {sorted[0], sorted[2], sorted[3], sorted[1]};
}

void sort_regions(std::vector<Region> & regions)
{
  std::stable_sort(regions.begin(), regions.end(),
    [](const Region & a, const Region & b) {
      const cv::Rect2f box_a = a.bounding_box();
      const cv::Rect2f box_b = b.bounding_box();
      if (box_a.y != box_b.y) {
        return box_a.y < box_b.y;
      }
      if (box_a.x != box_b.x) {
        return box_a.x < box_b.x;
      }
      return a.score > b.score;
    });
}

void clamp_to_image(std::vector<cv::Point2f> & points, const cv::Size & size)
{
  const float max_x = static_cast<float>(std::max(size.width - 1, 0));
  const float max_y = static_cast<float>(std::max(size.height - 1, 0));
  for (auto & p : points) {
    p.x = std::clamp(p.x, 0.0f, max_x);
    p.y = std::clamp(p.y, 0.0f, max_y);
  }
}

cv::Point2f unrotate_point(const cv::Point2f & point, const cv::Size & source_size)
{
  // Clockwise rotation maps (x, y) to (H - 1 - y, x)
  return {point.y, static_cast<float>(source_size.height - 1) - point.x};
}

void print_detection_results(const DetectionResult & result, size_t max_regions)
{
  std::cout << "\n=== Detection Results ===" << std::endl;
  std::cout << "Provider: " << result.provider << std::endl;
  std::cout << "Total regions: " << result.regions.size() << std::endl;

  size_t print_count = std::min(max_regions, result.regions.size());

  for (size_t i = 0; i < print_count; ++i) {
    const auto & region = result.regions[i];
    const cv::Rect2f box = region.bounding_box();

    std::cout << "Region " << (i + 1) << ": "
      << (region.vertical ? "vertical" : "horizontal")
      << " - Score: " << region.score << std::endl;
    std::cout << "  Polygon:";
    for (const auto & p : region.polygon) {
      std::cout << " (" << p.x << ", " << p.y << ")";
    }
    std::cout << std::endl;
    std::cout << "  Box: [" << box.x << ", " << box.y << ", "
      << (box.x + box.width) << ", " << (box.y + box.height) << "]" << std::endl;
  }

  if (result.regions.size() > max_regions) {
    std::cout << "... and " << (result.regions.size() - max_regions)
      << " more regions" << std::endl;
  }
}

cv::Mat plot_regions(
  const cv::Mat & image,
  const std::vector<Region> & regions,
  float confidence_threshold)
{
  if (image.empty()) {
    std::cerr << "Input image is empty" << std::endl;
    return cv::Mat(); // Return empty Mat on error
  }

  cv::Mat image_for_plot;
  if (image.channels() == 1) {
    cv::cvtColor(image, image_for_plot, cv::COLOR_GRAY2BGR);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, image_for_plot, cv::COLOR_BGRA2BGR);
  } else {
    image_for_plot = image.clone();
  }

  for (const auto & region : regions) {
    if (region.score < confidence_threshold || region.polygon.empty()) {
      continue;
    }

    std::vector<std::vector<cv::Point>> outline(1);
    for (const auto & p : region.polygon) {
      outline[0].emplace_back(cvRound(p.x), cvRound(p.y));
    }

    // Horizontal lines in green, vertical lines in orange
    const cv::Scalar colour = region.vertical ? cv::Scalar(0, 165, 255) : cv::Scalar(0, 255, 0);
    cv::polylines(image_for_plot, outline, true, colour, 2);

    std::string label_text = std::to_string(region.score).substr(0, 5);

    int baseline = 0;
    cv::Size text_size = cv::getTextSize(label_text, cv::FONT_HERSHEY_SIMPLEX,
      0.5, 1, &baseline);

    const cv::Point anchor = outline[0].front();
    cv::rectangle(image_for_plot,
      cv::Point(anchor.x, anchor.y - text_size.height - 4),
      cv::Point(anchor.x + text_size.width, anchor.y),
      colour, -1);

    cv::putText(image_for_plot, label_text, cv::Point(anchor.x, anchor.y - 4),
      cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 0), 1);
  }

  return image_for_plot;
}

cv::Mat render_mask(const cv::Mat & mask)
{
  if (mask.empty()) {
    return cv::Mat();
  }

  cv::Mat grey;
  mask.convertTo(grey, CV_8U, 255.0);

  cv::Mat coloured;
  cv::applyColorMap(grey, coloured, cv::COLORMAP_JET);
  return coloured;
}

} // namespace utils

} // namespace textdet
