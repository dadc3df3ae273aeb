#pragma once

#include "model/regressor.h"

namespace model {

/**
 * @brief LANDMARC-style weighted k nearest neighbours.
 *
 * Distances are Euclidean in feature space. The k closest training rows (ties
 * broken by training order) are combined with weights 1/d^2. If any training
 * row matches the query exactly, the mean label of the exact matches is returned.
 */
class KnnRegressor final : public IRegressor {
public:
  explicit KnnRegressor(int k = 3);

  std::string Name() const override { return "knn"; }
  void Fit(const Matrix& X, const Vector& y) override;
  Vector Predict(const Matrix& X) const override;
  bool IsFitted() const override { return fitted_; }

private:
  double PredictOne(const Eigen::Ref<const Eigen::RowVectorXd>& q) const;

  int k_;
  Matrix X_;
  Vector y_;
  bool fitted_ = false;
};

} // namespace model
