#include <functional>
#include <vector>

#include "logk/logistic.hpp"
#include "logk/parallel.hpp"
#include "logk/nvtx.hpp"

namespace logk {

namespace {

template <typename T> struct LogisticOp { T operator()(T x) const { return logistic(x); } };
template <typename T> struct LogitOp    { T operator()(T p) const { return logit(p); } };

// dest != src 이면서 [dest,dest+n) 과 [src,src+n) 이 겹치는 경우
template <typename T>
bool partially_overlaps(const T* dest, const T* src, std::size_t n) {
  if (dest == src) return false;
  std::less<const T*> lt;
  return lt(dest, src + n) && lt(src, dest + n);
}

template <typename T, typename Op>
void map_range(T* dest, const T* src, std::size_t n, int workers, Op op) {
  parallel_chunks(n, workers, [dest, src, op](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) dest[i] = op(src[i]);
  });
}

template <typename T, typename Op>
Status map_checked(T* dest, std::size_t n_dest, const T* src, std::size_t n_src,
                   const MapAttrs& attrs, Op op, const char* tag) {
  // 길이 계약은 원소를 건드리기 전에 한 번만 확인
  if (n_dest != n_src) return Status::ContractViolation;
  const std::size_t n = n_src;
  if (n == 0) return Status::Ok;
  if (!dest) return Status::MissingOutput;
  if (!src)  return Status::MissingInput;

  LOGK_NVTX_RANGE(tag, nvtx::Color::Blue);
  const int workers = resolve_num_workers(attrs);
  if (partially_overlaps(dest, src, n)) {
    // 다른 chunk 가 이미 덮어쓴 원소를 읽지 않도록 원본을 복사해 둔다
    const std::vector<T> snapshot(src, src + n);
    map_range(dest, snapshot.data(), n, workers, op);
  } else {
    map_range(dest, src, n, workers, op);
  }
  return Status::Ok;
}

template <typename T, typename Op>
std::vector<T> map_alloc(const std::vector<T>& src, const MapAttrs& attrs, Op op, const char* tag) {
  LOGK_NVTX_RANGE(tag, nvtx::Color::Green);
  std::vector<T> out(src.size());
  map_range(out.data(), src.data(), src.size(), resolve_num_workers(attrs), op);
  return out;
}

} // namespace

// ---------------- in-place ----------------
Status logistic_inplace(double* dest, std::size_t n_dest, const double* src, std::size_t n_src,
                        const MapAttrs& attrs) {
  return map_checked(dest, n_dest, src, n_src, attrs, LogisticOp<double>{}, "logistic_inplace_f64");
}

Status logit_inplace(double* dest, std::size_t n_dest, const double* src, std::size_t n_src,
                     const MapAttrs& attrs) {
  return map_checked(dest, n_dest, src, n_src, attrs, LogitOp<double>{}, "logit_inplace_f64");
}

Status logistic_inplace(float* dest, std::size_t n_dest, const float* src, std::size_t n_src,
                        const MapAttrs& attrs) {
  return map_checked(dest, n_dest, src, n_src, attrs, LogisticOp<float>{}, "logistic_inplace_f32");
}

Status logit_inplace(float* dest, std::size_t n_dest, const float* src, std::size_t n_src,
                     const MapAttrs& attrs) {
  return map_checked(dest, n_dest, src, n_src, attrs, LogitOp<float>{}, "logit_inplace_f32");
}

// ---------------- allocating ----------------
std::vector<double> logistic_vector(const std::vector<double>& src, const MapAttrs& attrs) {
  return map_alloc(src, attrs, LogisticOp<double>{}, "logistic_vector_f64");
}

std::vector<double> logit_vector(const std::vector<double>& src, const MapAttrs& attrs) {
  return map_alloc(src, attrs, LogitOp<double>{}, "logit_vector_f64");
}

std::vector<float> logistic_vector(const std::vector<float>& src, const MapAttrs& attrs) {
  return map_alloc(src, attrs, LogisticOp<float>{}, "logistic_vector_f32");
}

std::vector<float> logit_vector(const std::vector<float>& src, const MapAttrs& attrs) {
  return map_alloc(src, attrs, LogitOp<float>{}, "logit_vector_f32");
}

} // namespace logk
