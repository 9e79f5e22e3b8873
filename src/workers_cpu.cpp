#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <thread>

#include "logk/parallel.hpp"

namespace logk {

namespace {

// 양의 정수가 아니면 0
int parse_positive(const char* s) {
  if (!s || !*s) return 0;
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0') return 0;
  if (v <= 0 || v > INT_MAX) return 0;
  return static_cast<int>(v);
}

} // namespace

int default_num_workers() {
  if (const char* s = std::getenv("LOGK_NUM_THREADS")) {
    const int n = parse_positive(s);
    if (n > 0) return n;
    std::fprintf(stderr, "[logk] ignoring LOGK_NUM_THREADS=\"%s\" (expected a positive integer)\n", s);
  }
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<int>(hw) : 1;
}

int resolve_num_workers(const MapAttrs& attrs) {
  return attrs.is_default() ? default_num_workers() : attrs.num_workers;
}

} // namespace logk
