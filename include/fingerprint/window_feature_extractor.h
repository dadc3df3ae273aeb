#pragma once
/**
 * @file window_feature_extractor.h
 * @brief Two-phase sliding-window feature extraction per tag.
 *
 * For a tag with n chronological rows, warm-up size W0 and window size W:
 *  - Warm-up: rows [0, min(W0, n)) all receive the statistics of that single block.
 *  - Sliding: each row i in [W0, n) receives the statistics of its trailing window
 *    [max(0, i - W + 1), i].
 *
 * The warm-up rows intentionally share one statistic vector (they are not an
 * expanding window). Row count per tag is preserved.
 */

#include "fingerprint/fingerprint_row.h"

#include <cstddef>
#include <vector>

namespace fp {

struct WindowConfig {
  int warmup_size = 10;
  int window_size = 10;
};

// Throws rfpos::ConfigurationError for non-positive sizes.
void ValidateWindowConfig(const WindowConfig& cfg);

class WindowFeatureExtractor {
public:
  WindowFeatureExtractor(std::size_t antenna_count, const WindowConfig& cfg);

  // Rows of a single tag in chronological order. Output has the same length and order.
  std::vector<FeatureRow> ExtractTag(const std::vector<FingerprintRow>& tag_rows) const;

  /**
   * @brief Extract features for all tags.
   *
   * Tags are processed independently (in parallel when OpenMP is enabled). The
   * result is ordered by timestamp, then tag id.
   */
  std::vector<FeatureRow> Extract(const std::vector<FingerprintRow>& rows) const;

  FeatureLayout layout() const { return layout_; }
  const WindowConfig& config() const { return cfg_; }

private:
  FeatureLayout layout_;
  WindowConfig cfg_;
};

} // namespace fp
