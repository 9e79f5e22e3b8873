// include/logk/parallel.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include <algorithm>

#include "logk_export.h"
#include "attrs.hpp"

namespace logk {

// 기본 worker 수: LOGK_NUM_THREADS(양의 정수) → hardware_concurrency() → 1
LOGK_API int default_num_workers();

// attrs.num_workers <= 0 이면 default_num_workers(), 아니면 그대로.
LOGK_API int resolve_num_workers(const MapAttrs& attrs);

// [0,n) 을 k 개의 연속 구간으로 나눈 것 중 c 번째 (0 <= c < k).
// 앞쪽 n % k 개 구간이 1 원소씩 더 가진다. k == 0 은 k == 1 로 취급.
struct ChunkRange { std::size_t begin, end; };

inline ChunkRange chunk_of(std::size_t n, std::size_t k, std::size_t c) {
  if (k == 0) k = 1;
  const std::size_t base = n / k;
  const std::size_t rem  = n % k;
  const std::size_t begin = c * base + std::min(c, rem);
  return ChunkRange{begin, begin + base + (c < rem ? 1 : 0)};
}

// worker 스레드 생성기. 실패 시 std::system_error (std::thread 와 동일).
struct StdThreadSpawn {
  template <typename Body>
  std::thread operator()(Body body) const { return std::thread(std::move(body)); }
};

// fn(begin, end) 를 구간마다 한 번 호출. 마지막 구간은 호출 스레드에서 실행.
// 구간은 서로 겹치지 않으므로 lock 불필요; 반환 전에 모든 worker 를 join.
// worker 생성에 실패하면 남은 구간은 호출 스레드에서 이어서 처리한다.
// fn 은 예외를 던지지 않아야 한다.
template <typename Fn, typename Spawn>
void parallel_chunks(std::size_t n, int workers, Fn fn, Spawn spawn) {
  if (n == 0) return;
  const std::size_t k = std::min<std::size_t>(n, static_cast<std::size_t>(std::max(1, workers)));
  if (k == 1) {
    fn(std::size_t{0}, n);
    return;
  }

  std::vector<std::thread> threads;
  threads.reserve(k - 1);
  std::size_t c = 0;
  for (; c + 1 < k; ++c) {
    const ChunkRange r = chunk_of(n, k, c);
    try {
      threads.push_back(spawn([fn, r]() { fn(r.begin, r.end); }));
    } catch (const std::system_error& e) {
      std::fprintf(stderr, "[logk] worker %zu/%zu not started (%s), running inline\n", c, k, e.what());
      break;
    }
  }
  for (; c < k; ++c) {
    const ChunkRange r = chunk_of(n, k, c);
    fn(r.begin, r.end);
  }
  for (auto& t : threads) t.join();
}

template <typename Fn>
void parallel_chunks(std::size_t n, int workers, Fn fn) {
  parallel_chunks(n, workers, fn, StdThreadSpawn{});
}

} // namespace logk
