#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Local includes
#include "textdet/detection_types.hpp"
#include "textdet/image_buffer.hpp"
#include "textdet/inference_backend.hpp"
#include "textdet/model_artifact.hpp"
#include "textdet/options.hpp"
#include "textdet/post_processor.hpp"
#include "textdet/pre_processor.hpp"


namespace textdet
{
/**
 * @brief Text detector with an explicit load/unload lifecycle
 * @details The accelerator backend only exists between load() and unload().
 *          All operations take an internal mutex, so a Detector can be
 *          shared between threads; detect() calls then run one at a time.
 *          loaded() and state() read an atomic and never block.
 */
class Detector
{
public:
  enum class State
  {
    Unloaded,
    Loading,
    Ready
  };

  /**
   * @brief Create an unloaded detector
   * @details The preprocessor pads inputs to artifact.input_alignment,
   *          whatever alignment preprocessor_config carries.
   * @throws InvalidOptionsError if the artifact alignment is not positive
   */
  Detector(
    std::vector<std::string> preference,
    ModelArtifact artifact,
    std::shared_ptr<const ProviderRegistry> registry,
    const PreProcessor::Config & preprocessor_config = PreProcessor::Config());

  // Releases the backend if still loaded
  ~Detector();

  // Disable copy and move semantics - use std::unique_ptr for ownership transfer
  Detector(const Detector &) = delete;
  Detector & operator=(const Detector &) = delete;
  Detector(Detector &&) = delete;
  Detector & operator=(Detector &&) = delete;

  bool loaded() const noexcept { return state_.load() == State::Ready; }
  State state() const noexcept { return state_.load(); }

  /**
   * @brief Materialize the backend on the first working accelerator
   * @throws InvalidStateError if the detector is Loading or Ready
   * @throws BackendLoadError (NoAcceleratorAvailable) if no accelerator could
   *         load the model; the detector is left Unloaded
   */
  void load();

  /**
   * @brief Release every backend resource before returning
   * @details No-op when already Unloaded.
   */
  void unload();

  /**
   * @brief Detect text regions in one image
   * @details Pages far longer than decode.max_side_len in one direction are
   *          cut into square tiles, run one by one and stitched back, so
   *          their text is not shrunk by a single resize.
   * @param image Input image, not modified
   * @param preprocess Colour and rotation toggles
   * @param decode Thresholds and geometry parameters
   * @return Regions in image coordinates and the probability mask at image
   *         resolution
   * @throws NotLoadedError unless Ready
   * @throws InvalidOptionsError if decode is out of range
   * @throws InferenceError on backend or image processing failure
   */
  DetectionResult detect(
    const ImageBuffer & image,
    const PreprocessOptions & preprocess = PreprocessOptions(),
    const DecodeOptions & decode = DecodeOptions());

  // Provider serving the loaded backend, empty when not Ready
  std::string active_provider() const;

  const std::vector<std::string> & preference() const noexcept { return preference_; }
  const ModelArtifact & artifact() const noexcept { return artifact_; }

private:
  // One pass of preprocess, inference and decode; caller holds mutex_
  DetectionResult run_pass(
    const cv::Mat & bgr,
    const PreprocessOptions & preprocess,
    const DecodeOptions & decode);

  // Same for elongated pages: one inference per tile, maps stitched back
  DetectionResult run_tiled_pass(
    const cv::Mat & bgr,
    const PreprocessOptions & preprocess,
    const DecodeOptions & decode);

  BackendOutputs infer(const Tensor & input);

  DetectionResult finish_pass(
    const cv::Mat & probability,
    const cv::Mat & auxiliary,
    const ResizeTransform & transform,
    const DecodeOptions & decode) const;

  // Map a pass run on the rotated image back to the source orientation
  static void unrotate(DetectionResult & result, const cv::Size & source_size);

  // True when more than half of the regions are vertical
  static bool mostly_vertical(const std::vector<Region> & regions);

  std::vector<std::string> preference_;
  ModelArtifact artifact_;
  std::shared_ptr<const ProviderRegistry> registry_;

  PreProcessor preprocessor_;
  DBPostProcessor postprocessor_;

  mutable std::mutex mutex_;
  std::atomic<State> state_;
  std::unique_ptr<InferenceBackend> backend_;
};

} // namespace textdet
