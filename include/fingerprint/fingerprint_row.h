#pragma once
/**
 * @file fingerprint_row.h
 * @brief Derived (never persisted) row types flowing through the positioning pipeline.
 *
 * Column layout is fixed by the AntennaAxis: antenna j (0-based position on the
 * axis) owns base column j (signal) and base column k + j (read count), where k is
 * the antenna count.
 *
 * Feature vector layout (length L = 10k):
 *
 *   [ rawSignal(k) | rawReadCount(k) | mean(2k) | min(2k) | max(2k) | stddev(2k) ]
 *
 * Each statistic block covers the 2k base columns in base-column order.
 */

#include "rfpos_types.h"

#include <cstddef>
#include <string>
#include <vector>

namespace fp {

/**
 * @brief Sorted, de-duplicated antenna id list that fixes column order.
 */
class AntennaAxis {
public:
  AntennaAxis() = default;
  explicit AntennaAxis(std::vector<rfpos::AntennaId> ids);  // sorts + de-duplicates

  std::size_t size() const { return ids_.size(); }
  bool empty() const { return ids_.empty(); }
  const std::vector<rfpos::AntennaId>& ids() const { return ids_; }

  // Position of an antenna on the axis, or npos when unknown.
  std::size_t IndexOf(const rfpos::AntennaId& id) const;

  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

private:
  std::vector<rfpos::AntennaId> ids_;
};

struct FingerprintRow {
  rfpos::TagId tag_id;
  rfpos::Timestamp timestamp = 0;
  std::vector<rfpos::OptDouble> rssi;  // one per antenna on the axis
  std::vector<rfpos::OptDouble> rc;    // one per antenna on the axis
  rfpos::OptDouble true_x;
  rfpos::OptDouble true_y;

  // rssi followed by rc (2k columns).
  std::vector<rfpos::OptDouble> BaseColumns() const;
};

struct FeatureRow {
  std::vector<rfpos::OptDouble> features;  // length L = 10k

  // Trailing metadata; never part of the feature vector.
  rfpos::TagId tag_id;
  rfpos::Timestamp timestamp = 0;
  rfpos::OptDouble true_x;
  rfpos::OptDouble true_y;

  bool HasTruePosition() const { return true_x.has_value() && true_y.has_value(); }
};

enum class FeatureBlock {
  RAW_SIGNAL,
  RAW_READ_COUNT,
  MEAN,
  MIN,
  MAX,
  STDDEV
};

struct FeatureLayout {
  std::size_t antenna_count = 0;

  std::size_t BaseColumnCount() const { return 2 * antenna_count; }
  std::size_t Length() const { return 10 * antenna_count; }

  // First vector index of a block.
  std::size_t BlockOffset(FeatureBlock block) const;
  std::size_t BlockWidth(FeatureBlock block) const;

  // Human-readable name of vector entry i, e.g. "mean_rssi_A2" or "rc_A1".
  std::string FeatureName(std::size_t i, const AntennaAxis& axis) const;
};

} // namespace fp
