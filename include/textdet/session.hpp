#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <memory>
#include <string>
#include <vector>

// Local includes
#include "textdet/detector.hpp"
#include "textdet/inference_backend.hpp"
#include "textdet/model_artifact.hpp"
#include "textdet/pre_processor.hpp"


namespace textdet
{
/**
 * @brief Factory of detectors sharing one accelerator preference
 * @details Holds configuration only. Accelerator availability is not
 *          checked here but when a detector is loaded.
 */
class Session
{
public:
  struct Config
  {
    /**
     * @brief Provider identifiers in the order they are tried
     * @details Empty selects config::DEFAULT_PROVIDERS.
     */
    std::vector<std::string> providers;

    /**
     * @brief Append the host provider when the list does not contain it
     */
    bool cpu_fallback;

    /**
     * @brief Model bound to default_detector()
     */
    ModelArtifact model;

    /**
     * @brief Pre-processing shared by every detector of the session
     */
    PreProcessor::Config preprocessor;

    /**
     * @brief Default constructor
     * @details Initializes the configuration with default values.
     */
    Config()
    : cpu_fallback(true) {}
  };

  /**
   * @brief Capture the configuration; never fails
   * @param config Preference list and default model
   * @param registry Providers to resolve identifiers against, the built-in
   *        registry when null
   */
  explicit Session(
    const Config & config = Config(),
    std::shared_ptr<const ProviderRegistry> registry = nullptr);

  // New Unloaded detector for the session's default model
  std::unique_ptr<Detector> default_detector() const;

  // New Unloaded detector for another model with the same preference
  std::unique_ptr<Detector> detector(const ModelArtifact & artifact) const;

  // Resolved preference list, in trial order
  const std::vector<std::string> & preference() const noexcept { return preference_; }

  const ProviderRegistry & registry() const noexcept { return *registry_; }

private:
  Config config_;
  std::vector<std::string> preference_;
  std::shared_ptr<const ProviderRegistry> registry_;
};

} // namespace textdet
