#include "model/regressor.h"

#include "model/knn_regressor.h"
#include "model/random_forest_regressor.h"
#include "model/ridge_regressor.h"
#include "common/errors.h"

#include <algorithm>
#include <cctype>

namespace model {
namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

void CheckFitShapes(const std::string& name, const Matrix& X, const Vector& y) {
  if (X.rows() == 0 || X.cols() == 0) {
    throw rfpos::ConfigurationError(name + ": cannot fit on an empty matrix");
  }
  if (X.rows() != y.size()) {
    throw rfpos::ConfigurationError(name + ": " + std::to_string(X.rows()) + " rows but " +
                                    std::to_string(y.size()) + " labels");
  }
}

void CheckPredictShapes(const std::string& name, bool fitted, Eigen::Index n_features, const Matrix& X) {
  if (!fitted) {
    throw rfpos::ConfigurationError(name + ": Predict() called before Fit()");
  }
  if (X.cols() != n_features) {
    throw rfpos::ConfigurationError(name + ": expected " + std::to_string(n_features) +
                                    " features, got " + std::to_string(X.cols()));
  }
}

void ValidateRegressorConfig(const RegressorConfig& cfg) {
  const std::string type = to_lower(cfg.type);
  if (type == "ridge") {
    if (!(cfg.alpha >= 0.0)) {
      throw rfpos::ConfigurationError("ridge: alpha must be >= 0");
    }
  } else if (type == "knn") {
    if (cfg.k < 1) {
      throw rfpos::ConfigurationError("knn: k must be >= 1");
    }
  } else if (type == "random_forest") {
    if (cfg.n_estimators < 1) {
      throw rfpos::ConfigurationError("random_forest: n_estimators must be >= 1");
    }
    if (cfg.max_depth < 0) {
      throw rfpos::ConfigurationError("random_forest: max_depth must be >= 0");
    }
    if (cfg.min_samples_split < 2) {
      throw rfpos::ConfigurationError("random_forest: min_samples_split must be >= 2");
    }
    if (cfg.max_features < 0) {
      throw rfpos::ConfigurationError("random_forest: max_features must be >= 0");
    }
  } else {
    throw rfpos::ConfigurationError("Unsupported regressor type: " + cfg.type);
  }
}

std::unique_ptr<IRegressor> CreateRegressor(const RegressorConfig& cfg) {
  ValidateRegressorConfig(cfg);
  const std::string type = to_lower(cfg.type);
  if (type == "ridge") {
    return std::make_unique<RidgeRegressor>(cfg.alpha);
  }
  if (type == "knn") {
    return std::make_unique<KnnRegressor>(cfg.k);
  }
  RandomForestParams p;
  p.n_estimators = cfg.n_estimators;
  p.max_depth = cfg.max_depth;
  p.min_samples_split = cfg.min_samples_split;
  p.max_features = cfg.max_features;
  p.seed = cfg.seed;
  return std::make_unique<RandomForestRegressor>(p);
}

} // namespace model
