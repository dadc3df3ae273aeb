#pragma once

#include "fingerprint/fingerprint_row.h"
#include "model/regressor.h"

#include <cstddef>
#include <vector>

namespace positioning {

// Throws rfpos::ConfigurationError unless 0 < feature_count <= layout length.
void CheckFeatureCount(std::size_t feature_count, std::size_t length);

// True when the first feature_count entries are all set.
bool PrefixComplete(const fp::FeatureRow& row, std::size_t feature_count);

// Index of the first unset entry in the prefix, or feature_count if complete.
std::size_t FirstGap(const fp::FeatureRow& row, std::size_t feature_count);

// Dense matrix of the first feature_count entries of rows[idx[0..]]. Rows must be complete.
model::Matrix BuildFeatureMatrix(const std::vector<fp::FeatureRow>& rows,
                                 const std::vector<std::size_t>& idx,
                                 std::size_t feature_count);

} // namespace positioning
