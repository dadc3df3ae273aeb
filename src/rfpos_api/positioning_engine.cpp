#include "rfpos_api/positioning_engine.h"

#include <stdexcept>
#include <utility>

namespace rfpos_api {

bool PositioningEngine::Initialize(const std::string& system_xml, const std::string& xsd_dir) {
  cfg::ConfigBundle bundle = cfg::ConfigLoader::Load(system_xml, xsd_dir);
  std::unique_ptr<store::IReadingStore> s =
      store::CreateReadingStore(pipeline::StoreConfigFromProfile(bundle.store_profile));
  return Initialize(bundle, std::move(s));
}

bool PositioningEngine::Initialize(const cfg::ConfigBundle& bundle,
                                   std::unique_ptr<store::IReadingStore> store) {
  if (!store) {
    throw std::invalid_argument("PositioningEngine::Initialize: store is null");
  }
  params_ = pipeline::ParamsFromConfig(bundle.positioning);
  cfg_ = bundle;
  store_ = std::move(store);
  initialized_ = true;
  return initialized_;
}

pipeline::PositioningReport PositioningEngine::Run() {
  return Run(params_);
}

pipeline::PositioningReport PositioningEngine::Run(const pipeline::PositioningParams& params) {
  if (!initialized_) {
    throw std::logic_error("PositioningEngine::Run called before Initialize");
  }
  return pipeline::RunPositioning(*store_, params);
}

store::IReadingStore& PositioningEngine::store() {
  if (!store_) {
    throw std::logic_error("PositioningEngine::store called before Initialize");
  }
  return *store_;
}

} // namespace rfpos_api
