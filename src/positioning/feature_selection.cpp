#include "positioning/feature_selection.h"

#include "common/errors.h"

#include <algorithm>
#include <string>

namespace positioning {

void CheckFeatureCount(std::size_t feature_count, std::size_t length) {
  if (feature_count == 0) {
    throw rfpos::ConfigurationError("feature_count must be > 0");
  }
  if (feature_count > length) {
    throw rfpos::ConfigurationError("feature_count " + std::to_string(feature_count) +
                                    " exceeds feature vector length " + std::to_string(length));
  }
}

std::size_t FirstGap(const fp::FeatureRow& row, std::size_t feature_count) {
  const std::size_t n = std::min(feature_count, row.features.size());
  for (std::size_t j = 0; j < n; ++j) {
    if (!row.features[j]) return j;
  }
  return (n < feature_count) ? n : feature_count;
}

bool PrefixComplete(const fp::FeatureRow& row, std::size_t feature_count) {
  return FirstGap(row, feature_count) == feature_count;
}

model::Matrix BuildFeatureMatrix(const std::vector<fp::FeatureRow>& rows,
                                 const std::vector<std::size_t>& idx,
                                 std::size_t feature_count) {
  model::Matrix X((Eigen::Index)idx.size(), (Eigen::Index)feature_count);
  for (std::size_t r = 0; r < idx.size(); ++r) {
    const fp::FeatureRow& row = rows[idx[r]];
    for (std::size_t j = 0; j < feature_count; ++j) {
      const rfpos::OptDouble& v = row.features[j];
      if (!v) {
        throw rfpos::DataGapError("Row for tag '" + row.tag_id + "' has an unset feature at column " +
                                  std::to_string(j));
      }
      X((Eigen::Index)r, (Eigen::Index)j) = *v;
    }
  }
  return X;
}

} // namespace positioning
