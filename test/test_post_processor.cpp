// C++ standard library includes
#include <limits>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

// Google Test includes
#include <gtest/gtest.h>

// Local includes
#include "textdet/exception.hpp"
#include "textdet/post_processor.hpp"


class DBPostProcessorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    options.unclip_ratio = 0.0;
    options.box_score_threshold = 0.5;
    options.mask_threshold = 0.3;
    options.min_box_side = 3.0;
  }

  // Transform for a map that already is the original image
  static textdet::ResizeTransform identity(const cv::Size & size)
  {
    textdet::ResizeTransform transform;
    transform.original_size = size;
    transform.resized_size = size;
    transform.padded_size = size;
    transform.scale = 1.0;
    return transform;
  }

  static cv::Mat blank(int width, int height)
  {
    return cv::Mat::zeros(height, width, CV_32FC1);
  }

  static void fill(cv::Mat & map, const cv::Rect & rect, float value)
  {
    map(rect).setTo(cv::Scalar(value));
  }

  textdet::DBPostProcessor postprocessor;
  textdet::DecodeOptions options;
};


TEST_F(DBPostProcessorTest, EmptyMapHasNoRegions)
{
  cv::Mat map = blank(64, 64);
  auto regions = postprocessor.decode(map, identity(map.size()), options);
  EXPECT_TRUE(regions.empty());
}

TEST_F(DBPostProcessorTest, ZeroUnclipReturnsRawRectangle)
{
  cv::Mat map = blank(64, 64);
  fill(map, cv::Rect(10, 20, 40, 10), 1.0f);

  auto regions = postprocessor.decode(map, identity(map.size()), options);
  ASSERT_EQ(regions.size(), 1u);

  const std::vector<cv::Point2f> expected = {
    {10.0f, 20.0f}, {49.0f, 20.0f}, {49.0f, 29.0f}, {10.0f, 29.0f}};
  const auto & polygon = regions[0].polygon;
  ASSERT_EQ(polygon.size(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_NEAR(polygon[i].x, expected[i].x, 0.5f) << "corner " << i;
    EXPECT_NEAR(polygon[i].y, expected[i].y, 0.5f) << "corner " << i;
  }
  EXPECT_FALSE(regions[0].vertical);
  EXPECT_NEAR(regions[0].score, 1.0f, 1e-5f);
}

TEST_F(DBPostProcessorTest, UnclipGrowsRegion)
{
  cv::Mat map = blank(128, 128);
  fill(map, cv::Rect(40, 60, 40, 10), 1.0f);

  auto raw = postprocessor.decode(map, identity(map.size()), options);
  options.unclip_ratio = 2.0;
  auto grown = postprocessor.decode(map, identity(map.size()), options);

  ASSERT_EQ(raw.size(), 1u);
  ASSERT_EQ(grown.size(), 1u);

  const cv::Rect2f raw_box = raw[0].bounding_box();
  const cv::Rect2f grown_box = grown[0].bounding_box();
  EXPECT_LT(grown_box.x, raw_box.x);
  EXPECT_LT(grown_box.y, raw_box.y);
  EXPECT_GT(grown_box.width, raw_box.width);
  EXPECT_GT(grown_box.height, raw_box.height);

  // distance = 39 * 9 * 2 / (2 * (39 + 9)) = 7.3125
  EXPECT_NEAR(grown_box.height, 9.0f + 2.0f * 7.3125f, 0.5f);
}

TEST_F(DBPostProcessorTest, ThinComponentsAreDropped)
{
  cv::Mat map = blank(64, 64);
  fill(map, cv::Rect(5, 30, 50, 2), 1.0f);

  auto regions = postprocessor.decode(map, identity(map.size()), options);
  EXPECT_TRUE(regions.empty());
}

TEST_F(DBPostProcessorTest, LowScoreComponentsAreDropped)
{
  cv::Mat map = blank(64, 64);
  fill(map, cv::Rect(10, 10, 30, 10), 0.6f);

  options.box_score_threshold = 0.7;
  EXPECT_TRUE(postprocessor.decode(map, identity(map.size()), options).empty());

  options.box_score_threshold = 0.5;
  auto regions = postprocessor.decode(map, identity(map.size()), options);
  ASSERT_EQ(regions.size(), 1u);
  EXPECT_NEAR(regions[0].score, 0.6f, 1e-4f);
}

TEST_F(DBPostProcessorTest, HigherBoxThresholdNeverAddsRegions)
{
  cv::Mat map = blank(128, 128);
  fill(map, cv::Rect(10, 10, 30, 10), 0.95f);
  fill(map, cv::Rect(10, 40, 30, 10), 0.8f);
  fill(map, cv::Rect(10, 70, 30, 10), 0.65f);
  fill(map, cv::Rect(10, 100, 30, 10), 0.45f);

  size_t previous = std::numeric_limits<size_t>::max();
  for (double threshold : {0.0, 0.5, 0.7, 0.85, 0.99}) {
    options.box_score_threshold = threshold;
    const size_t count = postprocessor.decode(map, identity(map.size()), options).size();
    EXPECT_LE(count, previous) << "threshold " << threshold;
    previous = count;
  }
  EXPECT_EQ(previous, 0u);
}

TEST_F(DBPostProcessorTest, MaxCandidatesLimitsContours)
{
  cv::Mat map = blank(128, 64);
  fill(map, cv::Rect(5, 5, 30, 10), 1.0f);
  fill(map, cv::Rect(60, 40, 30, 10), 1.0f);

  EXPECT_EQ(postprocessor.decode(map, identity(map.size()), options).size(), 2u);

  options.max_candidates = 1;
  EXPECT_EQ(postprocessor.decode(map, identity(map.size()), options).size(), 1u);
}

TEST_F(DBPostProcessorTest, RegionsAreSortedTopToBottom)
{
  cv::Mat map = blank(128, 128);
  fill(map, cv::Rect(70, 90, 30, 10), 1.0f);
  fill(map, cv::Rect(60, 10, 30, 10), 1.0f);
  fill(map, cv::Rect(5, 10, 30, 10), 1.0f);

  auto regions = postprocessor.decode(map, identity(map.size()), options);
  ASSERT_EQ(regions.size(), 3u);
  EXPECT_NEAR(regions[0].bounding_box().x, 5.0f, 0.5f);
  EXPECT_NEAR(regions[1].bounding_box().x, 60.0f, 0.5f);
  EXPECT_NEAR(regions[2].bounding_box().y, 90.0f, 0.5f);
}

TEST_F(DBPostProcessorTest, VerticalComponentIsFlagged)
{
  cv::Mat map = blank(64, 128);
  fill(map, cv::Rect(20, 10, 10, 80), 1.0f);

  auto regions = postprocessor.decode(map, identity(map.size()), options);
  ASSERT_EQ(regions.size(), 1u);
  EXPECT_TRUE(regions[0].vertical);
  EXPECT_GT(regions[0].bounding_box().height, regions[0].bounding_box().width);
}

TEST_F(DBPostProcessorTest, CoordinatesMapToOriginalImage)
{
  // Original 100x50 resized by 1.28 to 128x64, score map at half resolution
  textdet::ResizeTransform transform;
  transform.original_size = cv::Size(100, 50);
  transform.resized_size = cv::Size(128, 64);
  transform.padded_size = cv::Size(128, 64);
  transform.scale = 1.28;

  cv::Mat map = blank(64, 32);
  fill(map, cv::Rect(8, 8, 32, 8), 1.0f);

  auto regions = postprocessor.decode(map, transform, options);
  ASSERT_EQ(regions.size(), 1u);

  const cv::Rect2f box = regions[0].bounding_box();
  EXPECT_NEAR(box.x, 8.0f * 2.0f / 1.28f, 0.5f);
  EXPECT_NEAR(box.y, 8.0f * 2.0f / 1.28f, 0.5f);
  EXPECT_NEAR(box.width, 31.0f * 2.0f / 1.28f, 0.5f);
}

TEST_F(DBPostProcessorTest, PointsAreClampedIntoImage)
{
  cv::Mat map = blank(64, 64);
  fill(map, cv::Rect(0, 0, 64, 20), 1.0f);

  options.unclip_ratio = 2.3;
  auto regions = postprocessor.decode(map, identity(map.size()), options);
  ASSERT_EQ(regions.size(), 1u);
  for (const auto & p : regions[0].polygon) {
    EXPECT_GE(p.x, 0.0f);
    EXPECT_GE(p.y, 0.0f);
    EXPECT_LE(p.x, 63.0f);
    EXPECT_LE(p.y, 63.0f);
  }
}

TEST_F(DBPostProcessorTest, ContourScoreIsMeanInsideContour)
{
  cv::Mat map = blank(32, 32);
  fill(map, cv::Rect(4, 4, 10, 10), 0.8f);
  fill(map, cv::Rect(4, 4, 5, 10), 0.4f);

  const std::vector<cv::Point> contour = {{4, 4}, {13, 4}, {13, 13}, {4, 13}};
  EXPECT_NEAR(textdet::DBPostProcessor::contour_score(map, contour), 0.6f, 1e-4f);
}

TEST_F(DBPostProcessorTest, TensorToMapAppliesSigmoid)
{
  textdet::Tensor tensor;
  tensor.shape = {1, 1, 2, 3};
  tensor.data = {0.0f, 0.0f, 0.0f, 20.0f, -20.0f, 0.0f};

  cv::Mat map = textdet::DBPostProcessor::tensor_to_map(tensor, true);
  ASSERT_EQ(map.rows, 2);
  ASSERT_EQ(map.cols, 3);
  EXPECT_NEAR(map.at<float>(0, 0), 0.5f, 1e-6f);
  EXPECT_NEAR(map.at<float>(1, 0), 1.0f, 1e-6f);
  EXPECT_NEAR(map.at<float>(1, 1), 0.0f, 1e-6f);

  cv::Mat raw = textdet::DBPostProcessor::tensor_to_map(tensor, false);
  EXPECT_FLOAT_EQ(raw.at<float>(1, 0), 20.0f);
}

TEST_F(DBPostProcessorTest, TensorToMapKeepsFirstChannel)
{
  textdet::Tensor tensor;
  tensor.shape = {1, 2, 1, 2};
  tensor.data = {0.1f, 0.2f, 0.9f, 0.8f};

  cv::Mat map = textdet::DBPostProcessor::tensor_to_map(tensor, false);
  ASSERT_EQ(map.total(), 2u);
  EXPECT_FLOAT_EQ(map.at<float>(0, 0), 0.1f);
  EXPECT_FLOAT_EQ(map.at<float>(0, 1), 0.2f);
}

TEST_F(DBPostProcessorTest, TensorToMapRejectsMalformedTensors)
{
  textdet::Tensor flat;
  flat.shape = {6};
  flat.data.assign(6, 0.0f);
  EXPECT_THROW(textdet::DBPostProcessor::tensor_to_map(flat, false), textdet::InferenceError);

  textdet::Tensor short_data;
  short_data.shape = {1, 1, 4, 4};
  short_data.data.assign(8, 0.0f);
  EXPECT_THROW(textdet::DBPostProcessor::tensor_to_map(short_data, false),
    textdet::InferenceError);

  textdet::Tensor batched;
  batched.shape = {2, 1, 2, 2};
  batched.data.assign(8, 0.0f);
  EXPECT_THROW(textdet::DBPostProcessor::tensor_to_map(batched, false), textdet::InferenceError);
}

TEST_F(DBPostProcessorTest, RestoreMaskCropsPaddingAndResizes)
{
  textdet::ResizeTransform transform;
  transform.original_size = cv::Size(200, 50);
  transform.resized_size = cv::Size(128, 32);
  transform.padded_size = cv::Size(128, 64);
  transform.scale = 0.64;

  // Content in the top half, padding below
  cv::Mat map = blank(64, 32);
  fill(map, cv::Rect(0, 0, 64, 16), 1.0f);

  cv::Mat restored = textdet::DBPostProcessor::restore_mask(map, transform);
  ASSERT_EQ(restored.size(), cv::Size(200, 50));
  EXPECT_EQ(restored.type(), CV_32FC1);
  EXPECT_NEAR(cv::mean(restored)[0], 1.0, 0.05);
}

TEST_F(DBPostProcessorTest, BorderIsRemovedFromMaskAndRegions)
{
  // A 100x50 image bordered to 400x400, then resized to 128x128
  textdet::ResizeTransform transform;
  transform.original_size = cv::Size(100, 50);
  transform.bordered_size = cv::Size(400, 400);
  transform.resized_size = cv::Size(128, 128);
  transform.padded_size = cv::Size(128, 128);
  transform.scale = 0.32;
  EXPECT_EQ(transform.content_size(), cv::Size(32, 16));

  cv::Mat map = blank(128, 128);
  fill(map, cv::Rect(0, 0, 32, 16), 1.0f);

  cv::Mat restored = textdet::DBPostProcessor::restore_mask(map, transform);
  ASSERT_EQ(restored.size(), cv::Size(100, 50));
  double min_value = 0.0;
  cv::minMaxLoc(restored, &min_value);
  EXPECT_GT(min_value, 0.99);

  auto regions = postprocessor.decode(map, transform, options);
  ASSERT_EQ(regions.size(), 1u);
  const cv::Rect2f box = regions[0].bounding_box();
  EXPECT_NEAR(box.x, 0.0f, 4.0f);
  EXPECT_NEAR(box.y, 0.0f, 4.0f);
  EXPECT_NEAR(box.x + box.width, 99.0f, 4.0f);
  EXPECT_NEAR(box.y + box.height, 49.0f, 4.0f);
}

TEST_F(DBPostProcessorTest, RestoreMaskRejectsEmptyGeometry)
{
  cv::Mat map = blank(8, 8);
  fill(map, cv::Rect(0, 0, 4, 4), 1.0f);
  EXPECT_THROW(textdet::DBPostProcessor::restore_mask(map, textdet::ResizeTransform()),
    textdet::InferenceError);
}
