#pragma once
/**
 * @file fingerprint_assembler.h
 * @brief Join raw readings into one wide FingerprintRow per (tag, timestamp).
 */

#include "fingerprint/fingerprint_row.h"
#include "store/records.h"

#include <map>
#include <vector>

namespace fp {

struct TruePosition {
  double x = 0.0;
  double y = 0.0;
};

using TruthMap = std::map<rfpos::TagId, TruePosition>;

// Axis over every antenna known to the store, sorted by antenna id.
AntennaAxis BuildAntennaAxis(const std::vector<store::Antenna>& antennas);

// Tags that carry both true coordinates; others are absent from the map.
TruthMap BuildTruthMap(const std::vector<store::Tag>& tags);

class FingerprintAssembler {
public:
  explicit FingerprintAssembler(AntennaAxis axis);

  /**
   * @brief Pivot readings into fingerprint rows.
   *
   * - One row per distinct (tag, timestamp), ordered by tag id then timestamp.
   * - Each antenna on the axis contributes (signal, read count); antennas without a
   *   reading at that exact timestamp leave both values unset.
   * - Several readings of the same (tag, antenna, timestamp) are averaged.
   * - True coordinates are left-joined from `truth` by tag id.
   *
   * @throws rfpos::DataError for a reading with an empty tag id or an antenna that
   *         is not on the axis. Nothing is dropped silently.
   */
  std::vector<FingerprintRow> Assemble(const std::vector<store::Reading>& readings,
                                       const TruthMap& truth) const;

  const AntennaAxis& axis() const { return axis_; }

private:
  AntennaAxis axis_;
};

} // namespace fp
