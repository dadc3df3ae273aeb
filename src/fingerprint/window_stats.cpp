#include "fingerprint/window_stats.h"

#include "common/errors.h"

#include <algorithm>
#include <cmath>

namespace fp {

ColumnStats ComputeColumnStats(const std::vector<std::vector<rfpos::OptDouble>>& table,
                               std::size_t begin,
                               std::size_t end,
                               std::size_t column) {
  ColumnStats out;
  if (end > table.size()) {
    throw rfpos::ConfigurationError("ComputeColumnStats: window exceeds table");
  }
  if (begin >= end) return out;

  // Two-pass: mean first, then squared deviations from it.
  double sum = 0.0;
  double lo = 0.0;
  double hi = 0.0;
  std::size_t n = 0;
  for (std::size_t r = begin; r < end; ++r) {
    const rfpos::OptDouble& v = table[r][column];
    if (!v) continue;
    if (n == 0) {
      lo = hi = *v;
    } else {
      lo = std::min(lo, *v);
      hi = std::max(hi, *v);
    }
    sum += *v;
    ++n;
  }
  if (n == 0) return out;

  const double mean = sum / static_cast<double>(n);
  double ss = 0.0;
  for (std::size_t r = begin; r < end; ++r) {
    const rfpos::OptDouble& v = table[r][column];
    if (!v) continue;
    const double d = *v - mean;
    ss += d * d;
  }

  out.mean = mean;
  out.min = lo;
  out.max = hi;
  out.stddev = std::sqrt(ss / static_cast<double>(n));
  return out;
}

std::vector<rfpos::OptDouble> ComputeWindowStats(
    const std::vector<std::vector<rfpos::OptDouble>>& table,
    std::size_t begin,
    std::size_t end,
    std::size_t n_cols) {
  std::vector<rfpos::OptDouble> out(4 * n_cols);
  for (std::size_t c = 0; c < n_cols; ++c) {
    const ColumnStats s = ComputeColumnStats(table, begin, end, c);
    out[0 * n_cols + c] = s.mean;
    out[1 * n_cols + c] = s.min;
    out[2 * n_cols + c] = s.max;
    out[3 * n_cols + c] = s.stddev;
  }
  return out;
}

} // namespace fp
