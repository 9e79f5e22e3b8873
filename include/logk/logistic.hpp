#pragma once
#include <cmath>
#include <cstddef>
#include <vector>

#include "logk_export.h"
#include "status.hpp"
#include "attrs.hpp"

namespace logk {

// ---------------- Scalar ----------------
// 도메인 검사 없음. 범위 밖 입력은 IEEE-754 규칙대로 NaN/±inf 로 전파된다.

// 1/(1+e^{-x}). x → +큰값: e^{-x} underflow → 1.0,  x → -큰값: e^{-x} = +inf → 0.0
inline double logistic(double x) { return 1.0 / (1.0 + std::exp(-x)); }
inline float  logistic(float x)  { return 1.f / (1.f + std::exp(-x)); }

// log(p/(1-p)). p==0 → -inf, p==1 → +inf, p∉[0,1] → NaN
inline double logit(double p) { return std::log(p / (1.0 - p)); }
inline float  logit(float p)  { return std::log(p / (1.f - p)); }

// ---------------- In-place (caller storage) ----------------
// dest[i] = f(src[i]), i in [0,n).
// - n_dest != n_src            → ContractViolation (아무것도 쓰지 않음)
// - n>0 && dest==nullptr       → MissingOutput
// - n>0 && src==nullptr        → MissingInput
// dest==src 허용(완전 in-place). 부분 겹침은 src 스냅샷 후 계산.
LOGK_API Status logistic_inplace(double* dest, std::size_t n_dest,
                                     const double* src, std::size_t n_src,
                                     const MapAttrs& attrs = {});
LOGK_API Status logit_inplace(double* dest, std::size_t n_dest,
                                  const double* src, std::size_t n_src,
                                  const MapAttrs& attrs = {});
LOGK_API Status logistic_inplace(float* dest, std::size_t n_dest,
                                     const float* src, std::size_t n_src,
                                     const MapAttrs& attrs = {});
LOGK_API Status logit_inplace(float* dest, std::size_t n_dest,
                                  const float* src, std::size_t n_src,
                                  const MapAttrs& attrs = {});

// std::vector 편의 오버로드 (길이 검사는 동일)
inline Status logistic_inplace(std::vector<double>& dest, const std::vector<double>& src,
                               const MapAttrs& attrs = {}) {
  return logistic_inplace(dest.data(), dest.size(), src.data(), src.size(), attrs);
}
inline Status logit_inplace(std::vector<double>& dest, const std::vector<double>& src,
                            const MapAttrs& attrs = {}) {
  return logit_inplace(dest.data(), dest.size(), src.data(), src.size(), attrs);
}
inline Status logistic_inplace(std::vector<float>& dest, const std::vector<float>& src,
                               const MapAttrs& attrs = {}) {
  return logistic_inplace(dest.data(), dest.size(), src.data(), src.size(), attrs);
}
inline Status logit_inplace(std::vector<float>& dest, const std::vector<float>& src,
                            const MapAttrs& attrs = {}) {
  return logit_inplace(dest.data(), dest.size(), src.data(), src.size(), attrs);
}

// ---------------- Allocating ----------------
// 새 버퍼를 할당해 채운다. 길이가 항상 같으므로 실패하지 않는다.
LOGK_API std::vector<double> logistic_vector(const std::vector<double>& src, const MapAttrs& attrs = {});
LOGK_API std::vector<double> logit_vector(const std::vector<double>& src, const MapAttrs& attrs = {});
LOGK_API std::vector<float>  logistic_vector(const std::vector<float>& src, const MapAttrs& attrs = {});
LOGK_API std::vector<float>  logit_vector(const std::vector<float>& src, const MapAttrs& attrs = {});

} // namespace logk
