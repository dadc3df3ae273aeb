#include "fingerprint/fingerprint_assembler.h"

#include "common/errors.h"

#include <utility>

namespace fp {
namespace {

struct CellAccumulator {
  std::vector<double> rssi_sum;
  std::vector<double> rc_sum;
  std::vector<int> count;

  explicit CellAccumulator(std::size_t k) : rssi_sum(k, 0.0), rc_sum(k, 0.0), count(k, 0) {}
};

} // namespace

AntennaAxis BuildAntennaAxis(const std::vector<store::Antenna>& antennas) {
  std::vector<rfpos::AntennaId> ids;
  ids.reserve(antennas.size());
  for (const auto& a : antennas) ids.push_back(a.antenna_id);
  return AntennaAxis(std::move(ids));
}

TruthMap BuildTruthMap(const std::vector<store::Tag>& tags) {
  TruthMap out;
  for (const auto& t : tags) {
    if (t.HasTruePosition()) {
      out[t.tag_id] = TruePosition{*t.true_x, *t.true_y};
    }
  }
  return out;
}

FingerprintAssembler::FingerprintAssembler(AntennaAxis axis) : axis_(std::move(axis)) {}

std::vector<FingerprintRow> FingerprintAssembler::Assemble(
    const std::vector<store::Reading>& readings,
    const TruthMap& truth) const {
  const std::size_t k = axis_.size();

  // Ordered map gives the (tag, timestamp) output order for free.
  std::map<std::pair<rfpos::TagId, rfpos::Timestamp>, CellAccumulator> cells;
  for (const auto& r : readings) {
    if (r.tag_id.empty()) {
      throw rfpos::DataError("Reading without tag id (antenna '" + r.antenna_id + "')");
    }
    const std::size_t j = axis_.IndexOf(r.antenna_id);
    if (j == AntennaAxis::npos) {
      throw rfpos::DataError("Reading for tag '" + r.tag_id + "' references unknown antenna '" +
                             r.antenna_id + "'");
    }
    auto it = cells.find({r.tag_id, r.timestamp});
    if (it == cells.end()) {
      it = cells.emplace(std::make_pair(r.tag_id, r.timestamp), CellAccumulator(k)).first;
    }
    CellAccumulator& acc = it->second;
    acc.rssi_sum[j] += r.rssi;
    acc.rc_sum[j] += static_cast<double>(r.read_count);
    acc.count[j] += 1;
  }

  std::vector<FingerprintRow> rows;
  rows.reserve(cells.size());
  for (const auto& kv : cells) {
    FingerprintRow row;
    row.tag_id = kv.first.first;
    row.timestamp = kv.first.second;
    row.rssi.assign(k, std::nullopt);
    row.rc.assign(k, std::nullopt);
    const CellAccumulator& acc = kv.second;
    for (std::size_t j = 0; j < k; ++j) {
      if (acc.count[j] == 0) continue;
      const double n = static_cast<double>(acc.count[j]);
      row.rssi[j] = acc.rssi_sum[j] / n;
      row.rc[j] = acc.rc_sum[j] / n;
    }
    auto t = truth.find(row.tag_id);
    if (t != truth.end()) {
      row.true_x = t->second.x;
      row.true_y = t->second.y;
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

} // namespace fp
