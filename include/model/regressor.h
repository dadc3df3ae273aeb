#pragma once
/**
 * @file regressor.h
 * @brief Single-output regression capability used to map fingerprints to one coordinate.
 *
 * Inputs are dense row-major matrices (one row per sample). Backends are created
 * by name through CreateRegressor(); each validates its own parameters.
 */

#include <Eigen/Dense>

#include <cstdint>
#include <memory>
#include <string>

namespace model {

typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> Matrix;
typedef Eigen::VectorXd Vector;

struct RegressorConfig {
  std::string type = "random_forest"; // random_forest | ridge | knn

  // ridge
  double alpha = 1e-3;

  // knn
  int k = 3;

  // random_forest
  int n_estimators = 100;
  int max_depth = 0;         // 0 = unlimited
  int min_samples_split = 2;
  int max_features = 0;      // 0 = all features
  std::uint64_t seed = 0;
};

class IRegressor {
public:
  virtual ~IRegressor() = default;

  virtual std::string Name() const = 0;

  // Throws rfpos::ConfigurationError on empty input or row/label mismatch.
  virtual void Fit(const Matrix& X, const Vector& y) = 0;

  // Throws rfpos::ConfigurationError when unfitted or the column count differs from Fit().
  virtual Vector Predict(const Matrix& X) const = 0;

  virtual bool IsFitted() const = 0;
};

// Shared argument checks for Fit()/Predict() implementations.
void CheckFitShapes(const std::string& name, const Matrix& X, const Vector& y);
void CheckPredictShapes(const std::string& name, bool fitted, Eigen::Index n_features, const Matrix& X);

void ValidateRegressorConfig(const RegressorConfig& cfg);

std::unique_ptr<IRegressor> CreateRegressor(const RegressorConfig& cfg);

} // namespace model
