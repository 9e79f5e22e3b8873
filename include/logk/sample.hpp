#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>
#include "logk_export.h"
#include "status.hpp"

namespace logk {

// 샘플 생성기는 항상 호출자가 넘긴다 (전역 seed 상태 없음).
// 같은 상태의 rng → 같은 샘플.

// out[0..n) 에 U(0,1) 확률값
LOGK_API Status uniform_probabilities(std::mt19937_64& rng, double* out, std::size_t n);
LOGK_API std::vector<double> uniform_probabilities(std::mt19937_64& rng, std::size_t n);

// out[0..n) 에 N(mean, stdev) log-odds. stdev <= 0 이면 전부 mean.
LOGK_API Status normal_log_odds(std::mt19937_64& rng, double* out, std::size_t n,
                                double mean = 0.0, double stdev = 1.0);
LOGK_API std::vector<double> normal_log_odds(std::mt19937_64& rng, std::size_t n,
                                             double mean = 0.0, double stdev = 1.0);

} // namespace logk
