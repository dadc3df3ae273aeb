#pragma once
/**
 * @file random_forest_regressor.h
 * @brief Bagged CART regression trees.
 *
 * Each tree is grown on a bootstrap sample of the training rows, choosing at every
 * node the split that minimises the summed squared error of the children among
 * `max_features` randomly drawn candidate columns. Tree t draws from its own
 * mt19937_64 stream seeded from (seed, t), so results do not depend on the
 * number of threads used to grow the forest.
 */

#include "model/regressor.h"

#include <cstdint>
#include <vector>

namespace model {

struct RandomForestParams {
  int n_estimators = 100;
  int max_depth = 0;         // 0 = unlimited
  int min_samples_split = 2;
  int max_features = 0;      // 0 = all
  std::uint64_t seed = 0;
};

class RandomForestRegressor final : public IRegressor {
public:
  explicit RandomForestRegressor(const RandomForestParams& params);

  std::string Name() const override { return "random_forest"; }
  void Fit(const Matrix& X, const Vector& y) override;
  Vector Predict(const Matrix& X) const override;
  bool IsFitted() const override { return !trees_.empty(); }

  std::size_t TreeCount() const { return trees_.size(); }

  struct Node {
    int feature = -1; // -1 marks a leaf
    double threshold = 0.0;
    int left = -1;
    int right = -1;
    double value = 0.0;
  };
  typedef std::vector<Node> Tree;

private:
  RandomForestParams params_;
  Eigen::Index n_features_ = 0;
  std::vector<Tree> trees_;
};

} // namespace model
