#include "fingerprint/fingerprint_row.h"

#include "common/errors.h"

#include <algorithm>
#include <utility>

namespace fp {

AntennaAxis::AntennaAxis(std::vector<rfpos::AntennaId> ids) : ids_(std::move(ids)) {
  std::sort(ids_.begin(), ids_.end());
  ids_.erase(std::unique(ids_.begin(), ids_.end()), ids_.end());
}

std::size_t AntennaAxis::IndexOf(const rfpos::AntennaId& id) const {
  auto it = std::lower_bound(ids_.begin(), ids_.end(), id);
  if (it == ids_.end() || *it != id) return npos;
  return static_cast<std::size_t>(it - ids_.begin());
}

std::vector<rfpos::OptDouble> FingerprintRow::BaseColumns() const {
  std::vector<rfpos::OptDouble> out;
  out.reserve(rssi.size() + rc.size());
  out.insert(out.end(), rssi.begin(), rssi.end());
  out.insert(out.end(), rc.begin(), rc.end());
  return out;
}

std::size_t FeatureLayout::BlockOffset(FeatureBlock block) const {
  const std::size_t k = antenna_count;
  switch (block) {
    case FeatureBlock::RAW_SIGNAL:     return 0;
    case FeatureBlock::RAW_READ_COUNT: return k;
    case FeatureBlock::MEAN:           return 2 * k;
    case FeatureBlock::MIN:            return 4 * k;
    case FeatureBlock::MAX:            return 6 * k;
    case FeatureBlock::STDDEV:         return 8 * k;
  }
  return 0;
}

std::size_t FeatureLayout::BlockWidth(FeatureBlock block) const {
  if (block == FeatureBlock::RAW_SIGNAL || block == FeatureBlock::RAW_READ_COUNT) {
    return antenna_count;
  }
  return 2 * antenna_count;
}

std::string FeatureLayout::FeatureName(std::size_t i, const AntennaAxis& axis) const {
  const std::size_t k = antenna_count;
  if (axis.size() != k || i >= Length()) {
    throw rfpos::ConfigurationError("FeatureName: index out of range");
  }
  if (i < 2 * k) {
    return (i < k ? "rssi_" : "rc_") + axis.ids()[i % k];
  }
  static const char* kPrefixes[] = {"mean", "min", "max", "stddev"};
  const std::size_t stat = (i - 2 * k) / (2 * k);
  const std::size_t base = (i - 2 * k) % (2 * k);
  return std::string(kPrefixes[stat]) + (base < k ? "_rssi_" : "_rc_") + axis.ids()[base % k];
}

} // namespace fp
