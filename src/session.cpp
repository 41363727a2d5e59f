#include <algorithm>
#include <utility>

// Local includes
#include "textdet/config.hpp"
#include "textdet/session.hpp"


namespace textdet
{

Session::Session(const Config & config, std::shared_ptr<const ProviderRegistry> registry)
: config_(config),
  preference_(config.providers.empty() ? config::DEFAULT_PROVIDERS : config.providers),
  registry_(registry ? std::move(registry) : ProviderRegistry::builtin())
{
  if (config_.cpu_fallback &&
    std::find(preference_.begin(), preference_.end(), config::CPU_PROVIDER) == preference_.end())
  {
    preference_.push_back(config::CPU_PROVIDER);
  }
}

std::unique_ptr<Detector> Session::default_detector() const
{
  return detector(config_.model);
}

std::unique_ptr<Detector> Session::detector(const ModelArtifact & artifact) const
{
  return std::make_unique<Detector>(preference_, artifact, registry_, config_.preprocessor);
}

} // namespace textdet
