#include <algorithm>
#include <cmath>

// OpenCV includes
#include <opencv2/imgproc.hpp>

// Local includes
#include "textdet/detection_types.hpp"


namespace textdet
{

cv::Size ResizeTransform::content_size() const
{
  const int width = static_cast<int>(std::lround(original_size.width * scale));
  const int height = static_cast<int>(std::lround(original_size.height * scale));
  return cv::Size(
    std::min(resized_size.width, std::max(1, width)),
    std::min(resized_size.height, std::max(1, height)));
}

cv::Rect2f Region::bounding_box() const
{
  if (polygon.empty()) {
    return cv::Rect2f();
  }

  float min_x = polygon[0].x, max_x = polygon[0].x;
  float min_y = polygon[0].y, max_y = polygon[0].y;
  for (const auto & p : polygon) {
    min_x = std::min(min_x, p.x);
    max_x = std::max(max_x, p.x);
    min_y = std::min(min_y, p.y);
    max_y = std::max(max_y, p.y);
  }
  return cv::Rect2f(min_x, min_y, max_x - min_x, max_y - min_y);
}

double Region::area() const
{
  if (polygon.size() < 3) {
    return 0.0;
  }
  std::vector<cv::Point2f> hull;
  cv::convexHull(polygon, hull);
  return cv::contourArea(hull);
}

double Region::aspect_ratio() const
{
  if (polygon.size() != 4) {
    const cv::Rect2f box = bounding_box();
    return box.height > 0.0f ? box.width / box.height : 0.0;
  }

  auto midpoint = [](const cv::Point2f & a, const cv::Point2f & b) {
      return (a + b) * 0.5f;
    };

  // Segments joining the midpoints of opposite sides
  const cv::Point2f across = midpoint(polygon[2], polygon[3]) - midpoint(polygon[0], polygon[1]);
  const cv::Point2f along = midpoint(polygon[1], polygon[2]) - midpoint(polygon[3], polygon[0]);

  const double across_len = std::hypot(across.x, across.y);
  const double along_len = std::hypot(along.x, along.y);
  return across_len > 0.0 ? along_len / across_len : 0.0;
}

} // namespace textdet
