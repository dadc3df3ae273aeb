#pragma once
/**
 * @file window_stats.h
 * @brief Column-wise mean / min / max / population standard deviation over a row window.
 *
 * Unset values are skipped per column. A column with no set value in the window
 * yields unset statistics (never zero).
 */

#include "rfpos_types.h"

#include <cstddef>
#include <vector>

namespace fp {

struct ColumnStats {
  rfpos::OptDouble mean;
  rfpos::OptDouble min;
  rfpos::OptDouble max;
  rfpos::OptDouble stddev;  // population (divide by n)
};

// Statistics of one column over rows [begin, end) of a row-major table.
ColumnStats ComputeColumnStats(const std::vector<std::vector<rfpos::OptDouble>>& table,
                               std::size_t begin,
                               std::size_t end,
                               std::size_t column);

/**
 * @brief Statistics for every column, laid out block-wise.
 *
 * Output length is 4 * n_cols: [mean(n_cols), min(n_cols), max(n_cols), stddev(n_cols)].
 */
std::vector<rfpos::OptDouble> ComputeWindowStats(
    const std::vector<std::vector<rfpos::OptDouble>>& table,
    std::size_t begin,
    std::size_t end,
    std::size_t n_cols);

} // namespace fp
