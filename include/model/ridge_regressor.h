#pragma once

#include "model/regressor.h"

namespace model {

// Linear least squares with intercept and an L2 penalty on the weights.
class RidgeRegressor final : public IRegressor {
public:
  explicit RidgeRegressor(double alpha = 1e-3);

  std::string Name() const override { return "ridge"; }
  void Fit(const Matrix& X, const Vector& y) override;
  Vector Predict(const Matrix& X) const override;
  bool IsFitted() const override { return fitted_; }

  const Vector& weights() const { return w_; }
  double intercept() const { return b_; }

private:
  double alpha_;
  Vector w_;
  double b_ = 0.0;
  bool fitted_ = false;
};

} // namespace model
