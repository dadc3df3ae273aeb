#pragma once

#include "config/config_loader.h"
#include "config/config_types.h"
#include "pipeline/positioning_pipeline.h"
#include "store/reading_store.h"

#include <memory>
#include <string>

namespace rfpos_api {

// Embedding surface: load configuration once, open the configured store and run
// positioning passes on demand.
class PositioningEngine {
public:
  PositioningEngine() = default;

  // Load config and open the active store profile.
  bool Initialize(const std::string& system_xml, const std::string& xsd_dir);

  // Use an already opened store instead of the configured one (config still required).
  bool Initialize(const cfg::ConfigBundle& bundle, std::unique_ptr<store::IReadingStore> store);

  // Throws std::logic_error when called before Initialize().
  pipeline::PositioningReport Run();
  pipeline::PositioningReport Run(const pipeline::PositioningParams& params);

  const cfg::ConfigBundle& config() const { return cfg_; }
  const pipeline::PositioningParams& params() const { return params_; }
  store::IReadingStore& store();
  bool initialized() const { return initialized_; }

private:
  cfg::ConfigBundle cfg_{};
  pipeline::PositioningParams params_{};
  std::unique_ptr<store::IReadingStore> store_;
  bool initialized_ = false;
};

} // namespace rfpos_api
