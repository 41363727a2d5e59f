#include <iostream>

// Local includes
#include "textdet/exception.hpp"
#include "textdet/providers/torch_backend.hpp"


namespace textdet
{

TorchBackend::TorchBackend(const ModelArtifact & artifact)
: artifact_(artifact),
  device_(torch::kCPU)
{
  try {
    if (torch::cuda::is_available()) {
      device_ = torch::Device(torch::kCUDA);
    }
    if (artifact_.torchscript_path.empty()) {
      throw BackendLoadError("TorchScript model path cannot be empty.");
    }
    // Load the TorchScript model
    model_ = torch::jit::load(artifact_.torchscript_path);
    model_.to(device_);
    model_.eval();
    std::cout << "Model loaded successfully on " <<
      (device_.is_cuda() ? "CUDA" : "CPU") << std::endl;
  } catch (const BackendLoadError &) {
    throw;
  } catch (const c10::Error & e) {
    throw BackendLoadError("PyTorch error loading model: " + std::string(e.what()));
  } catch (const std::exception & e) {
    throw BackendLoadError("Error loading model: " + std::string(e.what()));
  }
}

BackendOutputs TorchBackend::run(const Tensor & input)
{
  if (input.shape.size() != 4 || input.data.size() != input.element_count()) {
    throw InferenceError("Torch backend expects a [1, 3, H, W] input");
  }

  torch::NoGradGuard no_grad;

  BackendOutputs outputs;
  try {
    auto tensor = torch::from_blob(const_cast<float *>(input.data.data()),
      input.shape, torch::kFloat).to(device_);

    std::vector<torch::jit::IValue> inputs;
    inputs.push_back(tensor);
    auto output = model_.forward(inputs);

    // Single tensor, (db, mask) tuple or {"db": ..., "mask": ...} dict
    if (output.isTensor()) {
      outputs.probability = to_tensor(output.toTensor());
    } else if (output.isTuple()) {
      const auto & elements = output.toTuple()->elements();
      if (elements.empty()) {
        throw InferenceError("TorchScript model returned an empty tuple");
      }
      outputs.probability = to_tensor(elements[0].toTensor());
      if (elements.size() > 1 && elements[1].isTensor()) {
        outputs.mask = to_tensor(elements[1].toTensor());
      }
    } else if (output.isGenericDict()) {
      auto dict = output.toGenericDict();
      if (!dict.contains(artifact_.probability_output)) {
        throw InferenceError("TorchScript model has no '" + artifact_.probability_output +
          "' output");
      }
      outputs.probability = to_tensor(dict.at(artifact_.probability_output).toTensor());
      if (!artifact_.mask_output.empty() && dict.contains(artifact_.mask_output)) {
        outputs.mask = to_tensor(dict.at(artifact_.mask_output).toTensor());
      }
    } else {
      throw InferenceError("Unsupported TorchScript output type: " + output.tagKind());
    }
  } catch (const c10::Error & e) {
    throw InferenceError("PyTorch error during inference: " + std::string(e.what()));
  }

  return outputs;
}

Tensor TorchBackend::to_tensor(const torch::Tensor & tensor)
{
  auto cpu = tensor.detach().to(torch::kCPU, torch::kFloat).contiguous();

  Tensor result;
  result.shape.assign(cpu.sizes().begin(), cpu.sizes().end());
  result.data.assign(cpu.data_ptr<float>(), cpu.data_ptr<float>() + cpu.numel());
  return result;
}

std::unique_ptr<InferenceBackend> TorchProvider::create_backend(const ModelArtifact & artifact) const
{
  return std::make_unique<TorchBackend>(artifact);
}

} // namespace textdet
