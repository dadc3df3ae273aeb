#include "fingerprint/window_feature_extractor.h"

#include "fingerprint/window_stats.h"
#include "common/errors.h"

#include <algorithm>
#include <exception>
#include <iterator>
#include <map>
#include <string>

namespace fp {
namespace {

bool by_time_then_tag(const FeatureRow& a, const FeatureRow& b) {
  if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
  return a.tag_id < b.tag_id;
}

} // namespace

void ValidateWindowConfig(const WindowConfig& cfg) {
  if (cfg.warmup_size <= 0) {
    throw rfpos::ConfigurationError("warmup_size must be > 0 (got " +
                                    std::to_string(cfg.warmup_size) + ")");
  }
  if (cfg.window_size <= 0) {
    throw rfpos::ConfigurationError("window_size must be > 0 (got " +
                                    std::to_string(cfg.window_size) + ")");
  }
}

WindowFeatureExtractor::WindowFeatureExtractor(std::size_t antenna_count, const WindowConfig& cfg)
    : cfg_(cfg) {
  ValidateWindowConfig(cfg_);
  layout_.antenna_count = antenna_count;
}

std::vector<FeatureRow> WindowFeatureExtractor::ExtractTag(
    const std::vector<FingerprintRow>& tag_rows) const {
  const std::size_t k = layout_.antenna_count;
  const std::size_t n_cols = layout_.BaseColumnCount();
  const std::size_t n = tag_rows.size();
  if (n == 0) return {};

  std::vector<std::vector<rfpos::OptDouble>> base;
  base.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const FingerprintRow& row = tag_rows[i];
    if (row.rssi.size() != k || row.rc.size() != k) {
      throw rfpos::DataError("Fingerprint row for tag '" + row.tag_id +
                             "' does not match the antenna axis width");
    }
    if (i > 0 && row.timestamp < tag_rows[i - 1].timestamp) {
      throw rfpos::DataError("Fingerprint rows for tag '" + row.tag_id + "' are not chronological");
    }
    base.push_back(row.BaseColumns());
  }

  const std::size_t w0 = static_cast<std::size_t>(cfg_.warmup_size);
  const std::size_t w = static_cast<std::size_t>(cfg_.window_size);

  std::vector<FeatureRow> out(n);
  auto fill = [&](std::size_t i, const std::vector<rfpos::OptDouble>& stats) {
    FeatureRow& fr = out[i];
    fr.features.clear();
    fr.features.reserve(layout_.Length());
    fr.features.insert(fr.features.end(), base[i].begin(), base[i].end());
    fr.features.insert(fr.features.end(), stats.begin(), stats.end());
    fr.tag_id = tag_rows[i].tag_id;
    fr.timestamp = tag_rows[i].timestamp;
    fr.true_x = tag_rows[i].true_x;
    fr.true_y = tag_rows[i].true_y;
  };

  // Warm-up block: one statistic vector shared by every row in it.
  const std::size_t warm_end = std::min(w0, n);
  const std::vector<rfpos::OptDouble> warm_stats = ComputeWindowStats(base, 0, warm_end, n_cols);
  for (std::size_t i = 0; i < warm_end; ++i) {
    fill(i, warm_stats);
  }

  // Sliding phase: trailing window capped at width w.
  for (std::size_t i = w0; i < n; ++i) {
    const std::size_t begin = (i + 1 >= w) ? (i + 1 - w) : 0;
    fill(i, ComputeWindowStats(base, begin, i + 1, n_cols));
  }
  return out;
}

std::vector<FeatureRow> WindowFeatureExtractor::Extract(const std::vector<FingerprintRow>& rows) const {
  std::map<rfpos::TagId, std::vector<FingerprintRow>> by_tag;
  for (const auto& r : rows) {
    by_tag[r.tag_id].push_back(r);
  }

  std::vector<std::vector<FingerprintRow>> groups;
  groups.reserve(by_tag.size());
  for (auto& kv : by_tag) {
    std::stable_sort(kv.second.begin(), kv.second.end(),
                     [](const FingerprintRow& a, const FingerprintRow& b) {
                       return a.timestamp < b.timestamp;
                     });
    groups.push_back(std::move(kv.second));
  }

  std::vector<std::vector<FeatureRow>> per_tag(groups.size());
  std::vector<std::exception_ptr> errors(groups.size());

  #pragma omp parallel for schedule(dynamic)
  for (long long g = 0; g < (long long)groups.size(); ++g) {
    try {
      per_tag[(std::size_t)g] = ExtractTag(groups[(std::size_t)g]);
    } catch (...) {
      errors[(std::size_t)g] = std::current_exception();
    }
  }
  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }

  std::vector<FeatureRow> out;
  out.reserve(rows.size());
  for (auto& v : per_tag) {
    std::move(v.begin(), v.end(), std::back_inserter(out));
  }
  std::sort(out.begin(), out.end(), by_time_then_tag);
  return out;
}

} // namespace fp
