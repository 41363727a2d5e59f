#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <map>
#include <memory>
#include <string>
#include <vector>

// Local includes
#include "textdet/model_artifact.hpp"
#include "textdet/tensor.hpp"


namespace textdet
{
/**
 * @brief One loaded network bound to one accelerator
 * @details Construction acquires every accelerator resource, destruction
 *          releases them. Implementations are not required to be reentrant;
 *          the Detector serializes calls to run().
 */
class InferenceBackend
{
public:
  virtual ~InferenceBackend() = default;

  /**
   * @brief Run the network on one input
   * @param input [1, 3, H, W] normalized image, H and W multiples of the
   *        artifact's input_alignment
   * @return Score map and optional auxiliary mask
   * @throws InferenceError on shape mismatch or device fault
   */
  virtual BackendOutputs run(const Tensor & input) = 0;

  // Identifier of the provider that created this backend
  virtual std::string provider_name() const = 0;
};

/**
 * @brief An accelerator variant able to materialize backends
 * @details Adding an accelerator means adding a provider; the detector only
 *          sees the ordered list of identifiers.
 */
class ExecutionProvider
{
public:
  virtual ~ExecutionProvider() = default;

  // Identifier used in preference lists, e.g. "tensorrt"
  virtual std::string name() const = 0;

  /**
   * @brief Load the artifact on this accelerator
   * @throws BackendLoadError if the accelerator is unavailable or the model
   *         is missing, corrupt or incompatible
   */
  virtual std::unique_ptr<InferenceBackend> create_backend(const ModelArtifact & artifact) const = 0;
};

/**
 * @brief Identifier to provider lookup
 */
class ProviderRegistry
{
public:
  // Registry holding every provider compiled into the library
  static ProviderRegistry with_builtin_providers();

  // Shared instance of with_builtin_providers()
  static std::shared_ptr<const ProviderRegistry> builtin();

  // Add or replace the provider registered under provider->name()
  void register_provider(std::shared_ptr<const ExecutionProvider> provider);

  // nullptr when no provider has this identifier
  std::shared_ptr<const ExecutionProvider> find(const std::string & name) const;

  std::vector<std::string> names() const;

private:
  std::map<std::string, std::shared_ptr<const ExecutionProvider>> providers_;
};

/**
 * @brief Materialize a backend from the first provider that accepts the model
 * @param preference Provider identifiers in the order they are tried
 * @param registry Providers available to this build
 * @param artifact Model to load
 * @return Backend of the first provider that succeeded
 * @throws NoAcceleratorAvailable listing every failure when the list is
 *         exhausted (or empty)
 */
std::unique_ptr<InferenceBackend> create_inference_backend(
  const std::vector<std::string> & preference,
  const ProviderRegistry & registry,
  const ModelArtifact & artifact);

} // namespace textdet
