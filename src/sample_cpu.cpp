#include <random>
#include "logk/sample.hpp"

namespace logk {

namespace {

void fill_uniform(std::mt19937_64& rng, double* out, std::size_t n) {
  std::uniform_real_distribution<double> U(0.0, 1.0);
  for (std::size_t i = 0; i < n; ++i) {
    double u = U(rng);
    // [0,1) → (0,1): 0 은 logit 에서 -inf
    while (u == 0.0) u = U(rng);
    out[i] = u;
  }
}

void fill_normal(std::mt19937_64& rng, double* out, std::size_t n, double mean, double stdev) {
  if (!(stdev > 0.0)) {
    for (std::size_t i = 0; i < n; ++i) out[i] = mean;
    return;
  }
  std::normal_distribution<double> dist(mean, stdev);
  for (std::size_t i = 0; i < n; ++i) out[i] = dist(rng);
}

} // namespace

Status uniform_probabilities(std::mt19937_64& rng, double* out, std::size_t n) {
  if (n == 0) return Status::Ok;
  if (!out) return Status::MissingOutput;
  fill_uniform(rng, out, n);
  return Status::Ok;
}

std::vector<double> uniform_probabilities(std::mt19937_64& rng, std::size_t n) {
  std::vector<double> out(n);
  fill_uniform(rng, out.data(), n);
  return out;
}

Status normal_log_odds(std::mt19937_64& rng, double* out, std::size_t n, double mean, double stdev) {
  if (n == 0) return Status::Ok;
  if (!out) return Status::MissingOutput;
  fill_normal(rng, out, n, mean, stdev);
  return Status::Ok;
}

std::vector<double> normal_log_odds(std::mt19937_64& rng, std::size_t n, double mean, double stdev) {
  std::vector<double> out(n);
  fill_normal(rng, out.data(), n, mean, stdev);
  return out;
}

} // namespace logk
