#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "textdet/detection_utils.hpp"
#include "textdet/detector.hpp"
#include "textdet/exception.hpp"


namespace textdet
{

namespace
{

// The network dictates the input alignment, whatever the session default
PreProcessor::Config aligned_for(PreProcessor::Config config, const ModelArtifact & artifact)
{
  config.alignment = artifact.input_alignment;
  return config;
}

} // namespace

Detector::Detector(
  std::vector<std::string> preference,
  ModelArtifact artifact,
  std::shared_ptr<const ProviderRegistry> registry,
  const PreProcessor::Config & preprocessor_config)
: preference_(std::move(preference)),
  artifact_(std::move(artifact)),
  registry_(registry ? std::move(registry) : ProviderRegistry::builtin()),
  preprocessor_(aligned_for(preprocessor_config, artifact_)),
  state_(State::Unloaded)
{
}

Detector::~Detector()
{
  std::lock_guard<std::mutex> lock(mutex_);
  backend_.reset();
  state_ = State::Unloaded;
}

void Detector::load()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::Unloaded) {
    throw InvalidStateError("load() called on a detector that is already loaded");
  }

  state_ = State::Loading;
  try {
    backend_ = create_inference_backend(preference_, *registry_, artifact_);
  } catch (...) {
    // Any failure, textdet or not, must leave the detector reloadable
    backend_.reset();
    state_ = State::Unloaded;
    throw;
  }
  state_ = State::Ready;
}

void Detector::unload()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::Unloaded) {
    return;
  }
  backend_.reset();
  state_ = State::Unloaded;
  std::cout << "Text detector unloaded" << std::endl;
}

std::string Detector::active_provider() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return backend_ ? backend_->provider_name() : std::string();
}

DetectionResult Detector::detect(
  const ImageBuffer & image,
  const PreprocessOptions & preprocess,
  const DecodeOptions & decode)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::Ready || !backend_) {
    throw NotLoadedError("detect() called before load()");
  }
  decode.validate();

  try {
    const cv::Mat bgr = PreProcessor::to_bgr(image.mat());

    auto rotated_pass = [&]() {
        cv::Mat rotated;
        cv::rotate(bgr, rotated, cv::ROTATE_90_CLOCKWISE);
        DetectionResult result = run_pass(rotated, preprocess, decode);
        unrotate(result, bgr.size());
        return result;
      };

    if (preprocess.rotate) {
      return rotated_pass();
    }

    DetectionResult result = run_pass(bgr, preprocess, decode);
    if (preprocess.auto_rotate && mostly_vertical(result.regions)) {
      return rotated_pass();
    }
    return result;
  } catch (const cv::Exception & e) {
    throw InferenceError("Text detection failed: " + std::string(e.what()));
  }
}

DetectionResult Detector::run_pass(
  const cv::Mat & bgr,
  const PreprocessOptions & preprocess,
  const DecodeOptions & decode)
{
  if (preprocessor_.should_tile(bgr.size(), decode.max_side_len)) {
    return run_tiled_pass(bgr, preprocess, decode);
  }

  PreprocessedInput input = preprocessor_.process(bgr, preprocess, decode.max_side_len);
  BackendOutputs outputs = infer(input.tensor);

  cv::Mat probability = DBPostProcessor::tensor_to_map(
    outputs.probability, artifact_.probability_is_logits);
  cv::Mat auxiliary;
  if (!outputs.mask.empty()) {
    auxiliary = DBPostProcessor::tensor_to_map(outputs.mask, false);
  }
  return finish_pass(probability, auxiliary, input.transform, decode);
}

DetectionResult Detector::run_tiled_pass(
  const cv::Mat & bgr,
  const PreprocessOptions & preprocess,
  const DecodeOptions & decode)
{
  TiledInput input = preprocessor_.tile(bgr, preprocess, decode.max_side_len);

  std::vector<cv::Mat> probability_tiles;
  std::vector<cv::Mat> auxiliary_tiles;
  probability_tiles.reserve(input.tensors.size());
  for (const auto & tensor : input.tensors) {
    BackendOutputs outputs = infer(tensor);
    probability_tiles.push_back(DBPostProcessor::tensor_to_map(
        outputs.probability, artifact_.probability_is_logits));
    if (!outputs.mask.empty()) {
      auxiliary_tiles.push_back(DBPostProcessor::tensor_to_map(outputs.mask, false));
    }
  }

  cv::Mat probability = PreProcessor::stitch(probability_tiles, input.layout);
  cv::Mat auxiliary;
  if (!auxiliary_tiles.empty()) {
    auxiliary = PreProcessor::stitch(auxiliary_tiles, input.layout);
  }
  return finish_pass(probability, auxiliary, input.transform, decode);
}

BackendOutputs Detector::infer(const Tensor & input)
{
  BackendOutputs outputs = backend_->run(input);
  if (outputs.probability.empty()) {
    throw InferenceError("Backend returned no score map");
  }
  return outputs;
}

DetectionResult Detector::finish_pass(
  const cv::Mat & probability,
  const cv::Mat & auxiliary,
  const ResizeTransform & transform,
  const DecodeOptions & decode) const
{
  DetectionResult result;
  result.transform = transform;
  result.provider = backend_->provider_name();
  result.regions = postprocessor_.decode(probability, transform, decode);
  result.mask = DBPostProcessor::restore_mask(probability, transform);

  if (!auxiliary.empty()) {
    const cv::Mat clamped = cv::max(cv::min(auxiliary, 1.0), 0.0);
    result.auxiliary_mask = DBPostProcessor::restore_mask(clamped, transform);
  }

  return result;
}

void Detector::unrotate(DetectionResult & result, const cv::Size & source_size)
{
  for (auto & region : result.regions) {
    for (auto & p : region.polygon) {
      p = utils::unrotate_point(p, source_size);
    }
    utils::clamp_to_image(region.polygon, source_size);
    if (region.polygon.size() == 4) {
      region.polygon = utils::order_quad(region.polygon, region.vertical);
    } else {
      // Rotation keeps the walk clockwise, only the starting corner moves
      auto first = std::min_element(region.polygon.begin(), region.polygon.end(),
        [](const cv::Point2f & a, const cv::Point2f & b) {
          return a.x + a.y < b.x + b.y;
        });
      std::rotate(region.polygon.begin(), first, region.polygon.end());
      region.vertical = !region.vertical;
    }
  }
  utils::sort_regions(result.regions);

  if (!result.mask.empty()) {
    cv::rotate(result.mask, result.mask, cv::ROTATE_90_COUNTERCLOCKWISE);
  }
  if (!result.auxiliary_mask.empty()) {
    cv::rotate(result.auxiliary_mask, result.auxiliary_mask, cv::ROTATE_90_COUNTERCLOCKWISE);
  }
}

bool Detector::mostly_vertical(const std::vector<Region> & regions)
{
  if (regions.empty()) {
    return false;
  }
  const auto vertical = std::count_if(regions.begin(), regions.end(),
    [](const Region & region) {return region.vertical;});
  return static_cast<size_t>(vertical) * 2 > regions.size();
}

} // namespace textdet
