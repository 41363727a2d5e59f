#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <string>


namespace textdet
{
/**
 * @brief Location and I/O contract of a serialized detection network
 * @details The network is opaque: it takes one NCHW float input and emits a
 *          score map plus, optionally, an auxiliary mask. Each provider
 *          picks the serialization it understands and fails to load when
 *          that file is absent.
 */
struct ModelArtifact
{
  /**
   * @brief ONNX graph, used by the TensorRT and OpenCV DNN providers
   */
  std::string onnx_path;

  /**
   * @brief Serialized TensorRT engine
   * @details Loaded instead of parsing onnx_path when the file exists, and
   *          written after a successful build otherwise. Empty disables
   *          caching.
   */
  std::string engine_cache_path;

  /**
   * @brief TorchScript export of the same network, used by the torch provider
   */
  std::string torchscript_path;

  /**
   * @brief Name of the image input tensor
   */
  std::string input_name;

  /**
   * @brief Name of the score map output
   */
  std::string probability_output;

  /**
   * @brief Name of the auxiliary mask output, empty if the model has none
   */
  std::string mask_output;

  /**
   * @brief Whether the score map is emitted as logits (sigmoid applied)
   */
  bool probability_is_logits;

  /**
   * @brief Multiple the input height and width must be padded to
   */
  int input_alignment;

  /**
   * @brief Default constructor
   * @details Initializes the I/O contract of the DBNet text detector.
   */
  ModelArtifact()
  : input_name("input"), probability_output("db"), mask_output("mask"),
    probability_is_logits(true), input_alignment(32) {}

  explicit ModelArtifact(const std::string & onnx)
  : ModelArtifact()
  {
    onnx_path = onnx;
  }
};

} // namespace textdet
