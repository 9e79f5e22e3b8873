// include/logk/status.hpp
#pragma once
#include <cstdint>
#include "logk_export.h"

namespace logk {

// ---------------- Status ----------------
// 값 영역 예약(ABI 안정):
//   0: OK
//   1~  99: 공통/일반, 버퍼 누락
// 100~ 129: 길이/계약 불일치
// 900~ 999: 기타/미확인
enum class Status : int {
  Ok = 0,

  // 리소스 누락 (n > 0 인데 nullptr)
  MissingInput      = 10,
  MissingOutput     = 11,

  // 호출 계약 위반: in-place 호출에서 len(dest) != len(src)
  ContractViolation = 103,

  Unknown           = 999
};

// ---- ABI anchors (컴파일 타임 가드) ----
static_assert(static_cast<int>(Status::Ok) == 0,                  "Status ABI changed");
static_assert(static_cast<int>(Status::ContractViolation) == 103, "Status ABI changed");

[[nodiscard]] inline constexpr bool status_ok(Status s) noexcept {
  return s == Status::Ok;
}

// Stable printable name, never nullptr.
LOGK_API const char* status_name(Status s) noexcept;

} // namespace logk

// ---- 매크로: 에러 전파 ----
#ifndef LOGK_RETURN_IF_ERROR
#define LOGK_RETURN_IF_ERROR(expr)                                \
  do {                                                                \
    ::logk::Status _st__ = (expr);                                \
    if (_st__ != ::logk::Status::Ok) return _st__;                \
  } while (0)
#endif
