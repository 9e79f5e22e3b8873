// include/logk/attrs.hpp
#pragma once
#include <cstdint>
#include <type_traits>

namespace logk {

// 시퀀스 커널 실행 속성 (호출 단위).
//   num_workers > 0 : 그대로 사용 (1 == 직렬)
//   num_workers <= 0: default_num_workers() (LOGK_NUM_THREADS → hardware)
struct MapAttrs {
  std::int32_t num_workers{0};

  static constexpr MapAttrs serial()  { return MapAttrs{1}; }
  static constexpr MapAttrs workers(std::int32_t n) { return MapAttrs{n}; }

  bool is_default() const { return num_workers <= 0; }
};

static_assert(std::is_trivially_copyable<MapAttrs>::value, "MapAttrs must be POD/trivially copyable");

} // namespace logk
