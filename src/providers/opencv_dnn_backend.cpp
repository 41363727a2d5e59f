#include <algorithm>
#include <fstream>
#include <iostream>

// OpenCV includes
#include <opencv2/core/cuda.hpp>

// Local includes
#include "textdet/exception.hpp"
#include "textdet/providers/opencv_dnn_backend.hpp"


namespace textdet
{

OpenCvDnnBackend::OpenCvDnnBackend(const ModelArtifact & artifact, Target target)
: artifact_(artifact), target_(target)
{
  if (artifact_.onnx_path.empty() || !std::ifstream(artifact_.onnx_path).good()) {
    throw BackendLoadError("ONNX model not found: " + artifact_.onnx_path);
  }
  if (target_ == Target::CUDA && cv::cuda::getCudaEnabledDeviceCount() <= 0) {
    throw BackendLoadError("OpenCV has no CUDA device available");
  }

  try {
    net_ = cv::dnn::readNetFromONNX(artifact_.onnx_path);
    if (net_.empty()) {
      throw BackendLoadError("Failed to read ONNX model: " + artifact_.onnx_path);
    }

    if (target_ == Target::CUDA) {
      net_.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
      net_.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
    } else {
      net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
      net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    }

    output_names_.push_back(artifact_.probability_output);
    if (!artifact_.mask_output.empty()) {
      const auto layers = net_.getUnconnectedOutLayersNames();
      if (std::find(layers.begin(), layers.end(), artifact_.mask_output) != layers.end()) {
        output_names_.push_back(artifact_.mask_output);
      }
    }
  } catch (const cv::Exception & e) {
    throw BackendLoadError("Failed to read ONNX model: " + std::string(e.what()));
  }

  std::cout << "ONNX model loaded with OpenCV DNN on " << provider_name() << std::endl;
}

std::string OpenCvDnnBackend::provider_name() const
{
  return target_ == Target::CUDA ? "cuda" : "cpu";
}

BackendOutputs OpenCvDnnBackend::run(const Tensor & input)
{
  if (input.shape.size() != 4 || input.data.size() != input.element_count()) {
    throw InferenceError("OpenCV DNN backend expects a [1, 3, H, W] input");
  }

  std::vector<int> dims(input.shape.begin(), input.shape.end());
  cv::Mat blob(static_cast<int>(dims.size()), dims.data(), CV_32F,
    const_cast<float *>(input.data.data()));

  BackendOutputs outputs;
  try {
    net_.setInput(blob, artifact_.input_name);

    std::vector<cv::Mat> results;
    net_.forward(results, output_names_);

    outputs.probability = to_tensor(results.at(0));
    if (results.size() > 1) {
      outputs.mask = to_tensor(results.at(1));
    }
  } catch (const cv::Exception & e) {
    throw InferenceError("OpenCV DNN inference failed: " + std::string(e.what()));
  }
  return outputs;
}

Tensor OpenCvDnnBackend::to_tensor(const cv::Mat & blob)
{
  cv::Mat contiguous = blob.isContinuous() ? blob : blob.clone();
  if (contiguous.depth() != CV_32F) {
    contiguous.convertTo(contiguous, CV_32F);
  }

  Tensor tensor;
  for (int i = 0; i < contiguous.dims; ++i) {
    tensor.shape.push_back(contiguous.size[i]);
  }
  const auto * begin = contiguous.ptr<float>();
  tensor.data.assign(begin, begin + contiguous.total() * contiguous.channels());
  return tensor;
}

std::string OpenCvDnnProvider::name() const
{
  return target_ == OpenCvDnnBackend::Target::CUDA ? "cuda" : "cpu";
}

std::unique_ptr<InferenceBackend> OpenCvDnnProvider::create_backend(
  const ModelArtifact & artifact) const
{
  return std::make_unique<OpenCvDnnBackend>(artifact, target_);
}

} // namespace textdet
