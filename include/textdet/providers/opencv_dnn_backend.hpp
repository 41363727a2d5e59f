#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <string>
#include <vector>

// OpenCV includes
#include <opencv2/dnn.hpp>

// Local includes
#include "textdet/inference_backend.hpp"


namespace textdet
{
// ONNX graph executed by the OpenCV DNN module
class OpenCvDnnBackend : public InferenceBackend
{
public:
  enum class Target
  {
    CPU,
    CUDA
  };

  /**
   * @brief Read artifact.onnx_path and bind it to the target
   * @throws BackendLoadError if the file is missing or unreadable, or the
   *         CUDA target is requested without a CUDA device
   */
  OpenCvDnnBackend(const ModelArtifact & artifact, Target target);

  BackendOutputs run(const Tensor & input) override;

  std::string provider_name() const override;

private:
  static Tensor to_tensor(const cv::Mat & blob);

private:
  ModelArtifact artifact_;
  Target target_;
  cv::dnn::Net net_;
  std::vector<std::string> output_names_;
};

// Providers "cpu" and "cuda"
class OpenCvDnnProvider : public ExecutionProvider
{
public:
  explicit OpenCvDnnProvider(OpenCvDnnBackend::Target target)
  : target_(target) {}

  std::string name() const override;

  std::unique_ptr<InferenceBackend> create_backend(const ModelArtifact & artifact) const override;

private:
  OpenCvDnnBackend::Target target_;
};

} // namespace textdet
