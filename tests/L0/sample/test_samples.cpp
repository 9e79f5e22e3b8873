// tests/L0/sample/test_samples.cpp
#include <cstdio>
#include <random>
#include <vector>

#include "tests/common/host_utils.hpp"
#include "logk/sample.hpp"

using logk::Status;

int main() {
  const std::size_t N = 50000;

  // 같은 상태의 생성기 → 같은 샘플
  std::mt19937_64 a(99), b(99);
  const std::vector<double> pa = logk::uniform_probabilities(a, N);
  std::vector<double> pb(N);
  EXPECT_OR_RETURN(logk::uniform_probabilities(b, pb.data(), N) == Status::Ok, 1);
  EXPECT_OR_RETURN(bit_equal(pa, pb), 2);
  for (double v : pa) EXPECT_OR_RETURN(v > 0.0 && v < 1.0, 3);

  // 생성기 상태가 진행되므로 다음 호출은 다른 값
  const std::vector<double> pa2 = logk::uniform_probabilities(a, N);
  EXPECT_OR_RETURN(!bit_equal(pa, pa2), 4);

  // 정규 log-odds: 같은 seed 재현 + 대략적인 평균/분산
  std::mt19937_64 c(5), d(5);
  const std::vector<double> xc = logk::normal_log_odds(c, N, 1.5, 2.0);
  std::vector<double> xd(N);
  EXPECT_OR_RETURN(logk::normal_log_odds(d, xd.data(), N, 1.5, 2.0) == Status::Ok, 10);
  EXPECT_OR_RETURN(bit_equal(xc, xd), 11);
  double m = 0.0, m2 = 0.0;
  for (double v : xc) m += v;
  m /= static_cast<double>(N);
  for (double v : xc) m2 += (v - m) * (v - m);
  const double sd = std::sqrt(m2 / static_cast<double>(N - 1));
  EXPECT_OR_RETURN(std::fabs(m - 1.5) < 0.05, 12);
  EXPECT_OR_RETURN(std::fabs(sd - 2.0) < 0.05, 13);

  // stdev <= 0 → 상수
  const std::vector<double> flat = logk::normal_log_odds(c, 16, -3.0, 0.0);
  for (double v : flat) EXPECT_OR_RETURN(v == -3.0, 20);

  // 버퍼 누락 / 빈 입력
  EXPECT_OR_RETURN(logk::uniform_probabilities(c, nullptr, 4) == Status::MissingOutput, 30);
  EXPECT_OR_RETURN(logk::normal_log_odds(c, nullptr, 4) == Status::MissingOutput, 31);
  EXPECT_OR_RETURN(logk::uniform_probabilities(c, nullptr, 0) == Status::Ok, 32);

  std::printf("OK\n");
  return 0;
}
