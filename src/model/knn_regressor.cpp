#include "model/knn_regressor.h"

#include "common/errors.h"

#include <algorithm>
#include <numeric>
#include <vector>

namespace model {

KnnRegressor::KnnRegressor(int k) : k_(k) {
  if (k_ < 1) {
    throw rfpos::ConfigurationError("knn: k must be >= 1");
  }
}

void KnnRegressor::Fit(const Matrix& X, const Vector& y) {
  CheckFitShapes(Name(), X, y);
  X_ = X;
  y_ = y;
  fitted_ = true;
}

double KnnRegressor::PredictOne(const Eigen::Ref<const Eigen::RowVectorXd>& q) const {
  const Eigen::Index n = X_.rows();
  std::vector<double> d2((std::size_t)n);
  for (Eigen::Index i = 0; i < n; ++i) {
    d2[(std::size_t)i] = (X_.row(i) - q).squaredNorm();
  }

  // Exact matches short-circuit the inverse-distance weighting.
  double exact_sum = 0.0;
  std::size_t exact_n = 0;
  for (Eigen::Index i = 0; i < n; ++i) {
    if (d2[(std::size_t)i] == 0.0) {
      exact_sum += y_(i);
      ++exact_n;
    }
  }
  if (exact_n > 0) return exact_sum / static_cast<double>(exact_n);

  std::vector<std::size_t> order((std::size_t)n);
  std::iota(order.begin(), order.end(), std::size_t(0));
  const std::size_t kk = std::min<std::size_t>((std::size_t)k_, order.size());
  std::partial_sort(order.begin(), order.begin() + (std::ptrdiff_t)kk, order.end(),
                    [&d2](std::size_t a, std::size_t b) {
                      if (d2[a] != d2[b]) return d2[a] < d2[b];
                      return a < b;
                    });

  double wsum = 0.0;
  double acc = 0.0;
  for (std::size_t j = 0; j < kk; ++j) {
    const std::size_t i = order[j];
    const double w = 1.0 / d2[i];
    wsum += w;
    acc += w * y_((Eigen::Index)i);
  }
  return acc / wsum;
}

Vector KnnRegressor::Predict(const Matrix& X) const {
  CheckPredictShapes(Name(), fitted_, X_.cols(), X);
  Vector out(X.rows());

  #pragma omp parallel for schedule(static)
  for (long long r = 0; r < (long long)X.rows(); ++r) {
    out((Eigen::Index)r) = PredictOne(X.row((Eigen::Index)r));
  }
  return out;
}

} // namespace model
