#include <iostream>
#include <stdexcept>
#include <utility>

// Local includes
#include "textdet/exception.hpp"
#include "textdet/inference_backend.hpp"
#include "textdet/providers/opencv_dnn_backend.hpp"
#ifdef TEXTDET_WITH_TENSORRT
#include "textdet/providers/trt_backend.hpp"
#endif
#ifdef TEXTDET_WITH_TORCH
#include "textdet/providers/torch_backend.hpp"
#endif


namespace textdet
{

ProviderRegistry ProviderRegistry::with_builtin_providers()
{
  ProviderRegistry registry;
#ifdef TEXTDET_WITH_TENSORRT
  registry.register_provider(std::make_shared<TrtProvider>());
#endif
  registry.register_provider(std::make_shared<OpenCvDnnProvider>(OpenCvDnnBackend::Target::CUDA));
#ifdef TEXTDET_WITH_TORCH
  registry.register_provider(std::make_shared<TorchProvider>());
#endif
  registry.register_provider(std::make_shared<OpenCvDnnProvider>(OpenCvDnnBackend::Target::CPU));
  return registry;
}

std::shared_ptr<const ProviderRegistry> ProviderRegistry::builtin()
{
  static const std::shared_ptr<const ProviderRegistry> instance =
    std::make_shared<const ProviderRegistry>(with_builtin_providers());
  return instance;
}

void ProviderRegistry::register_provider(std::shared_ptr<const ExecutionProvider> provider)
{
  if (!provider) {
    throw std::invalid_argument("Cannot register a null execution provider");
  }
  const std::string name = provider->name();
  providers_[name] = std::move(provider);
}

std::shared_ptr<const ExecutionProvider> ProviderRegistry::find(const std::string & name) const
{
  auto it = providers_.find(name);
  if (it == providers_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::string> ProviderRegistry::names() const
{
  std::vector<std::string> result;
  result.reserve(providers_.size());
  for (const auto & entry : providers_) {
    result.push_back(entry.first);
  }
  return result;
}

std::unique_ptr<InferenceBackend> create_inference_backend(
  const std::vector<std::string> & preference,
  const ProviderRegistry & registry,
  const ModelArtifact & artifact)
{
  std::vector<std::string> failures;

  for (const auto & name : preference) {
    auto provider = registry.find(name);
    if (!provider) {
      failures.push_back(name + ": unknown execution provider");
      std::cerr << "Skipping execution provider '" << name << "': not available in this build"
                << std::endl;
      continue;
    }

    try {
      auto backend = provider->create_backend(artifact);
      if (!backend) {
        throw BackendLoadError("provider returned no backend");
      }
      std::cout << "Loaded text detector on execution provider '" << name << "'" << std::endl;
      return backend;
    } catch (const BackendLoadError & e) {
      failures.push_back(name + ": " + e.what());
      std::cerr << "Execution provider '" << name << "' failed: " << e.what() << std::endl;
    } catch (const std::exception & e) {
      // Library errors (cv::Exception, c10::Error, std::bad_alloc) also move on
      failures.push_back(name + ": " + e.what());
      std::cerr << "Execution provider '" << name << "' raised: " << e.what() << std::endl;
    }
  }

  std::string message = "No execution provider could load the text detector";
  if (preference.empty()) {
    message += " (empty preference list)";
  }
  for (const auto & failure : failures) {
    message += "\n  " + failure;
  }
  throw NoAcceleratorAvailable(message, failures);
}

} // namespace textdet
