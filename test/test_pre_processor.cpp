// C++ standard library includes
#include <limits>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Google Test includes
#include <gtest/gtest.h>

// Local includes
#include "textdet/config.hpp"
#include "textdet/exception.hpp"
#include "textdet/pre_processor.hpp"


class PreProcessorTest : public ::testing::Test
{
protected:
  // Value of tensor element [0, c, y, x]
  static float at(const textdet::Tensor & tensor, int c, int y, int x)
  {
    const auto height = tensor.shape[2];
    const auto width = tensor.shape[3];
    return tensor.data[(c * height + y) * width + x];
  }

  static textdet::PreProcessor::Config without_border()
  {
    textdet::PreProcessor::Config config;
    config.min_side = 0;
    return config;
  }

  textdet::PreProcessor preprocessor{without_border()};
  textdet::PreProcessor bordered;
  textdet::PreprocessOptions options;
};


TEST_F(PreProcessorTest, ResizeKeepsAspectAndAligns)
{
  cv::Mat image(70, 100, CV_8UC3, cv::Scalar::all(255));
  textdet::ResizeTransform transform;
  cv::Mat padded = preprocessor.resize_and_pad(image, 128, transform);

  EXPECT_EQ(transform.original_size, cv::Size(100, 70));
  EXPECT_EQ(transform.resized_size, cv::Size(128, 90));
  EXPECT_EQ(transform.padded_size, cv::Size(128, 96));
  EXPECT_EQ(padded.size(), transform.padded_size);
  EXPECT_EQ(transform.pad_right(), 0);
  EXPECT_EQ(transform.pad_bottom(), 6);
  EXPECT_DOUBLE_EQ(transform.scale, 1.28);
}

TEST_F(PreProcessorTest, LargeImagesAreDownscaled)
{
  cv::Mat image(1000, 4000, CV_8UC3, cv::Scalar::all(0));
  textdet::ResizeTransform transform;
  preprocessor.resize_and_pad(image, 2048, transform);

  EXPECT_EQ(transform.resized_size, cv::Size(2048, 512));
  EXPECT_EQ(transform.padded_size, cv::Size(2048, 512));
  EXPECT_DOUBLE_EQ(transform.scale, 0.512);
}

TEST_F(PreProcessorTest, SmallImagesAreUpscaled)
{
  cv::Mat image(10, 20, CV_8UC3, cv::Scalar::all(0));
  textdet::ResizeTransform transform;
  preprocessor.resize_and_pad(image, 64, transform);

  EXPECT_EQ(transform.resized_size, cv::Size(64, 32));
  EXPECT_EQ(transform.padded_size, cv::Size(64, 32));
}

TEST_F(PreProcessorTest, TransformMapsPointsBothWays)
{
  textdet::ResizeTransform transform;
  transform.scale = 2.0;

  const cv::Point2f original = transform.to_original(cv::Point2f(10.0f, 4.0f));
  EXPECT_FLOAT_EQ(original.x, 5.0f);
  EXPECT_FLOAT_EQ(original.y, 2.0f);

  const cv::Point2f working = transform.to_working(original);
  EXPECT_FLOAT_EQ(working.x, 10.0f);
  EXPECT_FLOAT_EQ(working.y, 4.0f);
}

TEST_F(PreProcessorTest, TensorIsNormalizedNchw)
{
  auto image = textdet::ImageBuffer::from_mat(cv::Mat(70, 100, CV_8UC3, cv::Scalar::all(255)));
  auto input = preprocessor.process(image, options, 128);

  const std::vector<int64_t> expected_shape = {1, 3, 96, 128};
  EXPECT_EQ(input.tensor.shape, expected_shape);
  EXPECT_EQ(input.tensor.data.size(), input.tensor.element_count());

  for (int c = 0; c < 3; ++c) {
    EXPECT_NEAR(at(input.tensor, c, 10, 10), 1.0f, 1e-5f);
    // Bottom padding holds the fill value
    EXPECT_NEAR(at(input.tensor, c, 95, 10), -1.0f, 1e-5f);
  }
}

TEST_F(PreProcessorTest, ChannelsAreSwappedToRgb)
{
  // Pure blue in BGR order
  auto image = textdet::ImageBuffer::from_mat(cv::Mat(32, 32, CV_8UC3, cv::Scalar(255, 0, 0)));
  auto input = preprocessor.process(image, options, 32);

  EXPECT_NEAR(at(input.tensor, 0, 5, 5), -1.0f, 1e-5f);
  EXPECT_NEAR(at(input.tensor, 1, 5, 5), -1.0f, 1e-5f);
  EXPECT_NEAR(at(input.tensor, 2, 5, 5), 1.0f, 1e-5f);
}

TEST_F(PreProcessorTest, InvertFlipsIntensities)
{
  auto image = textdet::ImageBuffer::from_mat(cv::Mat(32, 32, CV_8UC3, cv::Scalar::all(255)));
  options.invert = true;
  auto input = preprocessor.process(image, options, 32);

  EXPECT_NEAR(at(input.tensor, 0, 16, 16), -1.0f, 1e-5f);
}

TEST_F(PreProcessorTest, GammaCorrectionMovesMeanToMidGrey)
{
  cv::Mat dark(16, 16, CV_8UC3, cv::Scalar::all(64));
  cv::Mat corrected = textdet::PreProcessor::gamma_correct(dark);
  EXPECT_NEAR(cv::mean(corrected)[0], 127.5, 1.5);

  cv::Mat black(16, 16, CV_8UC3, cv::Scalar::all(0));
  EXPECT_EQ(cv::countNonZero(textdet::PreProcessor::gamma_correct(black).reshape(1)), 0);
}

TEST_F(PreProcessorTest, InputImageIsNotModified)
{
  cv::Mat source(40, 60, CV_8UC3);
  cv::randu(source, cv::Scalar::all(0), cv::Scalar::all(255));
  const cv::Mat reference = source.clone();

  options.invert = true;
  options.gamma_correct = true;
  preprocessor.process(source, options, 64);

  EXPECT_EQ(cv::norm(source, reference, cv::NORM_INF), 0.0);
}

TEST_F(PreProcessorTest, ToBgrConvertsGrayAndAlpha)
{
  cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(100));
  EXPECT_EQ(textdet::PreProcessor::to_bgr(gray).type(), CV_8UC3);

  cv::Mat bgra(8, 8, CV_8UC4, cv::Scalar(1, 2, 3, 4));
  cv::Mat bgr = textdet::PreProcessor::to_bgr(bgra);
  EXPECT_EQ(bgr.type(), CV_8UC3);
  EXPECT_EQ(bgr.at<cv::Vec3b>(0, 0), cv::Vec3b(1, 2, 3));

  cv::Mat two_channels(8, 8, CV_8UC2, cv::Scalar::all(0));
  EXPECT_THROW(textdet::PreProcessor::to_bgr(two_channels), textdet::DecodeError);
}

TEST_F(PreProcessorTest, RejectsInvalidInput)
{
  EXPECT_THROW(preprocessor.process(cv::Mat(), options, 64), textdet::DecodeError);

  cv::Mat image(8, 8, CV_8UC3, cv::Scalar::all(0));
  textdet::ResizeTransform transform;
  EXPECT_THROW(preprocessor.resize_and_pad(image, 0, transform), textdet::InvalidOptionsError);

  textdet::PreProcessor::Config config;
  config.alignment = 0;
  EXPECT_THROW(textdet::PreProcessor{config}, textdet::InvalidOptionsError);

  config = textdet::PreProcessor::Config();
  config.min_side = -1;
  EXPECT_THROW(textdet::PreProcessor{config}, textdet::InvalidOptionsError);
}

TEST_F(PreProcessorTest, OversizedSideLenIsRejected)
{
  cv::Mat image(8, 8, CV_8UC3, cv::Scalar::all(0));
  textdet::ResizeTransform transform;
  EXPECT_THROW(preprocessor.resize_and_pad(image, config::MAX_SIDE_LEN + 1, transform),
    textdet::InvalidOptionsError);
  EXPECT_THROW(preprocessor.process(image, options, std::numeric_limits<int>::max()),
    textdet::InvalidOptionsError);
  EXPECT_THROW(bordered.tile(image, options, config::MAX_SIDE_LEN + 1),
    textdet::InvalidOptionsError);
}

TEST_F(PreProcessorTest, SmallImagesGetBorderInsteadOfUpscale)
{
  cv::Mat image(50, 100, CV_8UC3, cv::Scalar::all(255));
  textdet::ResizeTransform transform;
  cv::Mat padded = bordered.resize_and_pad(image, 128, transform);

  EXPECT_EQ(transform.original_size, cv::Size(100, 50));
  EXPECT_EQ(transform.bordered_size, cv::Size(400, 400));
  EXPECT_EQ(transform.resized_size, cv::Size(128, 128));
  EXPECT_EQ(transform.padded_size, cv::Size(128, 128));
  EXPECT_DOUBLE_EQ(transform.scale, 0.32);
  EXPECT_EQ(transform.content_size(), cv::Size(32, 16));

  // Content keeps its place at the origin, the border is black
  EXPECT_EQ(padded.at<cv::Vec3b>(8, 16), cv::Vec3b(255, 255, 255));
  EXPECT_EQ(padded.at<cv::Vec3b>(8, 64), cv::Vec3b(0, 0, 0));
  EXPECT_EQ(padded.at<cv::Vec3b>(64, 16), cv::Vec3b(0, 0, 0));

  // Points scale like the content, the border does not shift them
  const cv::Point2f corner = transform.to_original(cv::Point2f(32.0f, 16.0f));
  EXPECT_NEAR(corner.x, 100.0f, 1e-3f);
  EXPECT_NEAR(corner.y, 50.0f, 1e-3f);
}

TEST_F(PreProcessorTest, BorderOnlyExtendsShortSides)
{
  EXPECT_EQ(bordered.bordered_size(cv::Size(1000, 120)), cv::Size(1000, 400));
  EXPECT_EQ(bordered.bordered_size(cv::Size(400, 400)), cv::Size(400, 400));
  EXPECT_EQ(bordered.bordered_size(cv::Size(640, 480)), cv::Size(640, 480));
  EXPECT_EQ(preprocessor.bordered_size(cv::Size(100, 50)), cv::Size(100, 50));

  cv::Mat image(480, 640, CV_8UC3, cv::Scalar::all(9));
  EXPECT_EQ(bordered.add_border(image).data, image.data);
}

TEST_F(PreProcessorTest, OnlyElongatedPagesAreTiled)
{
  EXPECT_TRUE(bordered.should_tile(cv::Size(100, 2000), 128));
  EXPECT_TRUE(bordered.should_tile(cv::Size(2000, 100), 128));
  EXPECT_FALSE(bordered.should_tile(cv::Size(100, 2000), 2048));
  EXPECT_FALSE(bordered.should_tile(cv::Size(1000, 1000), 128));
  // Long enough, but not elongated once bordered
  EXPECT_FALSE(bordered.should_tile(cv::Size(100, 1000), 128));
}

TEST_F(PreProcessorTest, TallPageIsCutIntoOverlappingBands)
{
  cv::Mat page(2000, 100, CV_8UC3, cv::Scalar::all(255));
  auto input = bordered.tile(page, options, 128);
  const auto & layout = input.layout;

  EXPECT_FALSE(layout.transposed);
  EXPECT_EQ(layout.page_size, cv::Size(400, 2000));
  EXPECT_EQ(layout.strips_per_tile, 2);
  EXPECT_EQ(layout.strip_height, 800);
  EXPECT_EQ(layout.strip_offsets, std::vector<int>({0, 600, 1200}));
  EXPECT_EQ(layout.tile_side, 128);
  EXPECT_EQ(layout.input_side, 128);
  EXPECT_EQ(layout.map_size, cv::Size(64, 320));
  EXPECT_EQ(layout.tile_count(), 2u);

  ASSERT_EQ(input.tensors.size(), 2u);
  const std::vector<int64_t> expected_shape = {1, 3, 128, 128};
  EXPECT_EQ(input.tensors[0].shape, expected_shape);

  // Tile 0 holds bands 0 and 1 side by side, tile 1 only band 2
  EXPECT_NEAR(at(input.tensors[0], 0, 5, 5), 1.0f, 1e-5f);
  EXPECT_NEAR(at(input.tensors[0], 0, 5, 32), -1.0f, 1e-5f);
  EXPECT_NEAR(at(input.tensors[0], 0, 5, 69), 1.0f, 1e-5f);
  EXPECT_NEAR(at(input.tensors[1], 0, 5, 5), 1.0f, 1e-5f);
  EXPECT_NEAR(at(input.tensors[1], 0, 5, 69), -1.0f, 1e-5f);

  EXPECT_EQ(input.transform.original_size, cv::Size(100, 2000));
  EXPECT_EQ(input.transform.bordered_size, cv::Size(400, 2000));
  EXPECT_EQ(input.transform.padded_size, cv::Size(64, 320));
  EXPECT_EQ(input.transform.content_size(), cv::Size(16, 320));
}

TEST_F(PreProcessorTest, StitchAveragesOverlappingBands)
{
  cv::Mat page(2000, 100, CV_8UC3, cv::Scalar::all(255));
  auto input = bordered.tile(page, options, 128);

  // Tile 0 (bands 0 and 1) scores 1, tile 1 (band 2) scores 0
  std::vector<cv::Mat> maps = {
    cv::Mat(128, 128, CV_32FC1, cv::Scalar(1.0f)),
    cv::Mat(64, 64, CV_32FC1, cv::Scalar(0.0f))};
  cv::Mat stitched = textdet::PreProcessor::stitch(maps, input.layout);

  ASSERT_EQ(stitched.size(), cv::Size(64, 320));
  EXPECT_NEAR(stitched.at<float>(50, 10), 1.0f, 1e-5f);
  EXPECT_NEAR(stitched.at<float>(110, 10), 1.0f, 1e-5f);
  // Bands 1 and 2 overlap on rows 192 to 223
  EXPECT_NEAR(stitched.at<float>(200, 10), 0.5f, 1e-5f);
  EXPECT_NEAR(stitched.at<float>(300, 10), 0.0f, 1e-5f);

  maps.pop_back();
  EXPECT_THROW(textdet::PreProcessor::stitch(maps, input.layout), textdet::InferenceError);
}

TEST_F(PreProcessorTest, WidePageIsTiledInItsTallOrientation)
{
  cv::Mat page(100, 2000, CV_8UC3, cv::Scalar::all(255));
  auto input = bordered.tile(page, options, 128);

  EXPECT_TRUE(input.layout.transposed);
  EXPECT_EQ(input.layout.page_size, cv::Size(400, 2000));
  EXPECT_EQ(input.tensors.size(), 2u);
  EXPECT_EQ(input.transform.padded_size, cv::Size(320, 64));

  // Bands run left to right again inside each tile
  EXPECT_NEAR(at(input.tensors[0], 0, 5, 5), 1.0f, 1e-5f);
  EXPECT_NEAR(at(input.tensors[0], 0, 32, 5), -1.0f, 1e-5f);
  EXPECT_NEAR(at(input.tensors[0], 0, 69, 5), 1.0f, 1e-5f);

  std::vector<cv::Mat> maps(2, cv::Mat(128, 128, CV_32FC1, cv::Scalar(0.25f)));
  cv::Mat stitched = textdet::PreProcessor::stitch(maps, input.layout);
  ASSERT_EQ(stitched.size(), cv::Size(320, 64));
  EXPECT_NEAR(cv::mean(stitched)[0], 0.25, 1e-5);
}
