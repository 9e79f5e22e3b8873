// tests/L0/config/test_num_workers.cpp
#include <cstdio>
#include <cstdlib>
#include <thread>

#include "tests/common/host_utils.hpp"
#include "logk/parallel.hpp"

int main() {
  const unsigned hw = std::thread::hardware_concurrency();
  const int fallback = hw > 0 ? static_cast<int>(hw) : 1;

  unset_env("LOGK_NUM_THREADS");
  EXPECT_OR_RETURN(logk::default_num_workers() == fallback, 1);
  EXPECT_OR_RETURN(logk::resolve_num_workers(logk::MapAttrs{}) == fallback, 2);

  set_env("LOGK_NUM_THREADS", "3");
  EXPECT_OR_RETURN(logk::default_num_workers() == 3, 3);
  EXPECT_OR_RETURN(logk::resolve_num_workers(logk::MapAttrs{}) == 3, 4);
  EXPECT_OR_RETURN(logk::resolve_num_workers(logk::MapAttrs{-1}) == 3, 5);
  // 명시값은 환경변수보다 우선
  EXPECT_OR_RETURN(logk::resolve_num_workers(logk::MapAttrs::workers(5)) == 5, 6);
  EXPECT_OR_RETURN(logk::resolve_num_workers(logk::MapAttrs::serial()) == 1, 7);

  // 잘못된 값은 무시 (stderr 경고 후 hardware 값)
  for (const char* bad : {"", "abc", "0", "-2", "4x", "99999999999999999999"}) {
    set_env("LOGK_NUM_THREADS", bad);
    if (logk::default_num_workers() != fallback) {
      std::fprintf(stderr, "LOGK_NUM_THREADS=\"%s\" not ignored\n", bad);
      return 10;
    }
  }

  unset_env("LOGK_NUM_THREADS");
  std::printf("OK\n");
  return 0;
}
