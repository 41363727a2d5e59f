#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <string>

// Torch includes
#include <torch/torch.h>
#include <torch/script.h>

// Local includes
#include "textdet/inference_backend.hpp"


namespace textdet
{
// Text detection network running as a TorchScript module
class TorchBackend : public InferenceBackend
{
public:
  /**
   * @brief Load artifact.torchscript_path on CUDA when available, else CPU
   * @throws BackendLoadError if the path is empty or the module fails to load
   */
  explicit TorchBackend(const ModelArtifact & artifact);

  BackendOutputs run(const Tensor & input) override;

  std::string provider_name() const override { return "torch"; }

  bool on_cuda() const { return device_.is_cuda(); }

private:
  // Copy a CPU float tensor out of torch
  static Tensor to_tensor(const torch::Tensor & tensor);

private:
  ModelArtifact artifact_;
  torch::jit::script::Module model_;
  torch::Device device_;
};

// Provider "torch"
class TorchProvider : public ExecutionProvider
{
public:
  std::string name() const override { return "torch"; }

  std::unique_ptr<InferenceBackend> create_backend(const ModelArtifact & artifact) const override;
};

} // namespace textdet
