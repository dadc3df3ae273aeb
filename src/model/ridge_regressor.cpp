/**
 * @file ridge_regressor.cpp
 * @brief Ridge regression on centred data via Eigen LDLT.
 *
 * @details
 *   With column means mu_x and label mean mu_y, solves
 *     (Xc^T Xc + alpha I) w = Xc^T yc,   b = mu_y - mu_x . w
 *   A small diagonal floor keeps the system solvable when alpha is 0 and
 *   columns are collinear or constant. Constant columns contribute nothing
 *   after centring, so an all-constant input predicts the label mean.
 */

#include "model/ridge_regressor.h"

#include "common/errors.h"

namespace model {

namespace {
constexpr double kDiagFloor = 1e-12;
}

RidgeRegressor::RidgeRegressor(double alpha) : alpha_(alpha) {
  if (!(alpha_ >= 0.0)) {
    throw rfpos::ConfigurationError("ridge: alpha must be >= 0");
  }
}

void RidgeRegressor::Fit(const Matrix& X, const Vector& y) {
  CheckFitShapes(Name(), X, y);

  const Eigen::RowVectorXd mu_x = X.colwise().mean();
  const double mu_y = y.mean();

  const Matrix Xc = X.rowwise() - mu_x;
  const Vector yc = (y.array() - mu_y).matrix();

  Matrix A = Xc.transpose() * Xc;
  A.diagonal().array() += alpha_ + kDiagFloor;
  const Vector rhs = Xc.transpose() * yc;

  Eigen::LDLT<Matrix> ldlt(A);
  if (ldlt.info() != Eigen::Success) {
    throw rfpos::ConfigurationError("ridge: normal equations could not be factorised");
  }
  w_ = ldlt.solve(rhs);
  b_ = mu_y - mu_x.transpose().dot(w_);
  fitted_ = true;
}

Vector RidgeRegressor::Predict(const Matrix& X) const {
  CheckPredictShapes(Name(), fitted_, w_.size(), X);
  Vector out = X * w_;
  out.array() += b_;
  return out;
}

} // namespace model
