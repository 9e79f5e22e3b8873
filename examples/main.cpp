#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <random>
#include <vector>

#include "logk/logistic.hpp"
#include "logk/parallel.hpp"
#include "logk/sample.hpp"

using clk = std::chrono::high_resolution_clock;

static double max_abs_diff(const std::vector<double>& a, const std::vector<double>& b) {
  double m = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) m = std::max(m, std::fabs(a[i] - b[i]));
  return m;
}

static void report(const char* tag, clk::time_point t0, clk::time_point t1,
                   const std::vector<double>& p, const std::vector<double>& back) {
  std::chrono::duration<double, std::milli> ms = t1 - t0;
  std::cout << tag << " N=" << p.size() << " time=" << ms.count() << " ms  "
            << "max|logistic(logit(p)) - p| = " << max_abs_diff(p, back) << "\n";
}

// logit → logistic 를 같은 버퍼에서 (할당 없이)
static logk::Status roundtrip_inplace(std::vector<double>& buf, const std::vector<double>& p,
                                      const logk::MapAttrs& attrs) {
  LOGK_RETURN_IF_ERROR(logk::logit_inplace(buf, p, attrs));
  LOGK_RETURN_IF_ERROR(logk::logistic_inplace(buf, buf, attrs));
  return logk::Status::Ok;
}

int main(int argc, char** argv) {
  std::size_t N = 1 << 22; // 4M
  if (argc > 1) N = static_cast<std::size_t>(std::max(1L, std::atol(argv[1])));

  std::mt19937_64 rng(42);
  const std::vector<double> p = logk::uniform_probabilities(rng, N);

  // 1) 원소별 루프 (scalar 함수 직접 호출)
  std::vector<double> back(N);
  auto t0 = clk::now();
  for (std::size_t i = 0; i < N; ++i) back[i] = logk::logistic(logk::logit(p[i]));
  auto t1 = clk::now();
  report("[loop]          ", t0, t1, p, back);

  // 2) 할당 버전: 매 호출마다 새 버퍼 (중간 결과 1개 + 최종 1개)
  const logk::MapAttrs serial = logk::MapAttrs::serial();
  t0 = clk::now();
  const std::vector<double> lo = logk::logit_vector(p, serial);
  back = logk::logistic_vector(lo, serial);
  t1 = clk::now();
  report("[vector]        ", t0, t1, p, back);

  // 3) in-place: 미리 잡아둔 버퍼 재사용
  std::vector<double> buf(N);
  t0 = clk::now();
  logk::Status st = roundtrip_inplace(buf, p, serial);
  t1 = clk::now();
  if (st != logk::Status::Ok) {
    std::cerr << "inplace failed: " << logk::status_name(st) << "\n";
    return 1;
  }
  report("[inplace]       ", t0, t1, p, buf);

  // 4) in-place + worker 수 변경
  const int hw = logk::default_num_workers();
  for (int w : {1, 2, 4, hw}) {
    t0 = clk::now();
    st = roundtrip_inplace(buf, p, logk::MapAttrs::workers(w));
    t1 = clk::now();
    if (st != logk::Status::Ok) {
      std::cerr << "threaded inplace failed: " << logk::status_name(st) << "\n";
      return 1;
    }
    std::cout << "[threads=" << w << "]";
    report("", t0, t1, p, buf);
  }
  return 0;
}
