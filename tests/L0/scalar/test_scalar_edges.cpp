// tests/L0/scalar/test_scalar_edges.cpp
#include <cmath>
#include <cstdio>
#include <limits>

#include "tests/common/host_utils.hpp"
#include "logk/logistic.hpp"

int main() {
  const double inf = std::numeric_limits<double>::infinity();
  const double nan = std::numeric_limits<double>::quiet_NaN();

  // 정확히 같아야 하는 값
  EXPECT_OR_RETURN(logk::logistic(0.0) == 0.5, 1);
  EXPECT_OR_RETURN(logk::logit(0.5) == 0.0, 2);

  // 포화
  EXPECT_OR_RETURN(logk::logistic(1000.0) == 1.0, 3);
  EXPECT_OR_RETURN(logk::logistic(-1000.0) == 0.0, 4);
  EXPECT_OR_RETURN(logk::logistic(inf) == 1.0, 5);
  EXPECT_OR_RETURN(logk::logistic(-inf) == 0.0, 6);
  EXPECT_OR_RETURN(logk::logistic(std::numeric_limits<double>::max()) == 1.0, 7);
  EXPECT_OR_RETURN(logk::logistic(-std::numeric_limits<double>::max()) == 0.0, 8);
  EXPECT_OR_RETURN(std::isnan(logk::logistic(nan)), 9);

  // 경계 / 도메인 밖: 예외 없이 ±inf, NaN
  EXPECT_OR_RETURN(logk::logit(0.0) == -inf, 10);
  EXPECT_OR_RETURN(logk::logit(1.0) == inf, 11);
  EXPECT_OR_RETURN(std::isnan(logk::logit(-0.5)), 12);
  EXPECT_OR_RETURN(std::isnan(logk::logit(1.5)), 13);
  EXPECT_OR_RETURN(std::isnan(logk::logit(nan)), 14);

  // 단조 증가, (0,1) 안
  double prev = logk::logistic(-30.0);
  EXPECT_OR_RETURN(prev > 0.0 && prev < 1.0, 15);
  for (int i = 1; i <= 240; ++i) {
    const double x = -30.0 + 0.25 * i;
    const double y = logk::logistic(x);
    if (!(y > prev) || !(y > 0.0) || !(y < 1.0)) {
      std::fprintf(stderr, "not increasing/bounded at x=%g: %.17g (prev %.17g)\n", x, y, prev);
      return 16;
    }
    prev = y;
  }

  // float 오버로드
  const float finf = std::numeric_limits<float>::infinity();
  EXPECT_OR_RETURN(logk::logistic(0.f) == 0.5f, 20);
  EXPECT_OR_RETURN(logk::logit(0.5f) == 0.f, 21);
  EXPECT_OR_RETURN(logk::logistic(200.f) == 1.f, 22);
  EXPECT_OR_RETURN(logk::logistic(-200.f) == 0.f, 23);
  EXPECT_OR_RETURN(logk::logit(0.f) == -finf, 24);
  EXPECT_OR_RETURN(logk::logit(1.f) == finf, 25);
  EXPECT_OR_RETURN(std::isnan(logk::logit(1.5f)), 26);

  std::printf("OK\n");
  return 0;
}
