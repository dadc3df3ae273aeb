#include "model/random_forest_regressor.h"

#include "common/errors.h"

#include <algorithm>
#include <exception>
#include <limits>
#include <numeric>
#include <random>

namespace model {
namespace {

constexpr std::uint64_t kSeedMix = 0x9E3779B97F4A7C15ULL;

struct TreeBuilder {
  const Matrix& X;
  const Vector& y;
  const RandomForestParams& p;
  std::mt19937_64& rng;
  int n_candidates;
  RandomForestRegressor::Tree nodes;

  double Mean(const std::vector<Eigen::Index>& idx) const {
    double s = 0.0;
    for (Eigen::Index i : idx) s += y(i);
    return s / static_cast<double>(idx.size());
  }

  bool AllLabelsEqual(const std::vector<Eigen::Index>& idx) const {
    for (Eigen::Index i : idx) {
      if (y(i) != y(idx.front())) return false;
    }
    return true;
  }

  // Draw n_candidates distinct columns (partial Fisher-Yates).
  std::vector<int> CandidateFeatures() {
    std::vector<int> cols((std::size_t)X.cols());
    std::iota(cols.begin(), cols.end(), 0);
    for (int j = 0; j < n_candidates; ++j) {
      std::uniform_int_distribution<int> pick(j, (int)cols.size() - 1);
      std::swap(cols[(std::size_t)j], cols[(std::size_t)pick(rng)]);
    }
    cols.resize((std::size_t)n_candidates);
    return cols;
  }

  int Build(std::vector<Eigen::Index>& idx, int depth) {
    const int id = (int)nodes.size();
    nodes.push_back(RandomForestRegressor::Node());
    nodes[(std::size_t)id].value = Mean(idx);

    const bool depth_exhausted = p.max_depth > 0 && depth >= p.max_depth;
    if (depth_exhausted || (int)idx.size() < p.min_samples_split || AllLabelsEqual(idx)) {
      return id;
    }

    double total = 0.0;
    for (Eigen::Index i : idx) total += y(i);
    const double n_all = static_cast<double>(idx.size());

    // Maximising sum_l^2/n_l + sum_r^2/n_r minimises the children's squared error.
    double best_score = total * total / n_all;
    int best_feature = -1;
    double best_threshold = 0.0;

    std::vector<Eigen::Index> sorted(idx);
    for (int f : CandidateFeatures()) {
      std::sort(sorted.begin(), sorted.end(), [&](Eigen::Index a, Eigen::Index b) {
        if (X(a, f) != X(b, f)) return X(a, f) < X(b, f);
        return a < b;
      });
      double left_sum = 0.0;
      for (std::size_t j = 0; j + 1 < sorted.size(); ++j) {
        left_sum += y(sorted[j]);
        const double v = X(sorted[j], f);
        const double v_next = X(sorted[j + 1], f);
        if (v == v_next) continue;
        const double nl = static_cast<double>(j + 1);
        const double nr = n_all - nl;
        const double right_sum = total - left_sum;
        const double score = left_sum * left_sum / nl + right_sum * right_sum / nr;
        if (score > best_score + 1e-12) {
          best_score = score;
          best_feature = f;
          best_threshold = 0.5 * (v + v_next);
        }
      }
    }
    if (best_feature < 0) return id;

    std::vector<Eigen::Index> left;
    std::vector<Eigen::Index> right;
    for (Eigen::Index i : idx) {
      if (X(i, best_feature) <= best_threshold) {
        left.push_back(i);
      } else {
        right.push_back(i);
      }
    }
    idx.clear();
    idx.shrink_to_fit();

    const int l = Build(left, depth + 1);
    const int r = Build(right, depth + 1);
    RandomForestRegressor::Node& node = nodes[(std::size_t)id];
    node.feature = best_feature;
    node.threshold = best_threshold;
    node.left = l;
    node.right = r;
    return id;
  }
};

double PredictTree(const RandomForestRegressor::Tree& tree, const Matrix& X, Eigen::Index row) {
  int id = 0;
  while (tree[(std::size_t)id].feature >= 0) {
    const RandomForestRegressor::Node& n = tree[(std::size_t)id];
    id = (X(row, n.feature) <= n.threshold) ? n.left : n.right;
  }
  return tree[(std::size_t)id].value;
}

} // namespace

RandomForestRegressor::RandomForestRegressor(const RandomForestParams& params) : params_(params) {
  if (params_.n_estimators < 1) {
    throw rfpos::ConfigurationError("random_forest: n_estimators must be >= 1");
  }
  if (params_.max_depth < 0) {
    throw rfpos::ConfigurationError("random_forest: max_depth must be >= 0");
  }
  if (params_.min_samples_split < 2) {
    throw rfpos::ConfigurationError("random_forest: min_samples_split must be >= 2");
  }
  if (params_.max_features < 0) {
    throw rfpos::ConfigurationError("random_forest: max_features must be >= 0");
  }
}

void RandomForestRegressor::Fit(const Matrix& X, const Vector& y) {
  CheckFitShapes(Name(), X, y);

  const int d = (int)X.cols();
  const int n_candidates = (params_.max_features > 0) ? std::min(params_.max_features, d) : d;
  const Eigen::Index n = X.rows();

  std::vector<Tree> trees((std::size_t)params_.n_estimators);
  std::vector<std::exception_ptr> errors(trees.size());

  #pragma omp parallel for schedule(dynamic)
  for (long long t = 0; t < (long long)trees.size(); ++t) {
    try {
      std::mt19937_64 rng(params_.seed ^ ((std::uint64_t)t * kSeedMix));
      std::uniform_int_distribution<Eigen::Index> draw(0, n - 1);
      std::vector<Eigen::Index> sample((std::size_t)n);
      for (auto& s : sample) s = draw(rng);

      TreeBuilder b{X, y, params_, rng, n_candidates, {}};
      b.Build(sample, 0);
      trees[(std::size_t)t] = std::move(b.nodes);
    } catch (...) {
      errors[(std::size_t)t] = std::current_exception();
    }
  }
  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }

  trees_ = std::move(trees);
  n_features_ = X.cols();
}

Vector RandomForestRegressor::Predict(const Matrix& X) const {
  CheckPredictShapes(Name(), IsFitted(), n_features_, X);
  Vector out(X.rows());

  #pragma omp parallel for schedule(static)
  for (long long r = 0; r < (long long)X.rows(); ++r) {
    double s = 0.0;
    for (const Tree& tree : trees_) s += PredictTree(tree, X, (Eigen::Index)r);
    out((Eigen::Index)r) = s / static_cast<double>(trees_.size());
  }
  return out;
}

} // namespace model
