// src/bindings/logk_pybind.cpp
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>

#include "logk/logistic.hpp"
#include "logk/parallel.hpp"

namespace py = pybind11;
using namespace logk;

// ------------------------- helpers -------------------------
using F64Array = py::array_t<double, py::array::c_style | py::array::forcecast>;
// dest 는 변환 없이 받아야 한다 (forcecast 복사본에 쓰면 호출자에게 안 보임)
using F64Out   = py::array_t<double, py::array::c_style>;

static void throw_if_bad(Status st, const char* where) {
  if (st == Status::Ok) return;
  const std::string msg = std::string(where) + " failed with Status=" + status_name(st)
                        + " (" + std::to_string(static_cast<int>(st)) + ")";
  if (st == Status::ContractViolation || st == Status::MissingInput || st == Status::MissingOutput) {
    throw std::invalid_argument(msg);
  }
  throw std::runtime_error(msg);
}

static MapAttrs attrs_of(int num_workers) {
  MapAttrs a{};
  a.num_workers = num_workers;
  return a;
}

template <typename Fn>
static F64Array apply_vector(const F64Array& src, int num_workers, Fn fn) {
  py::buffer_info in = src.request();
  const double* ptr = static_cast<const double*>(in.ptr);
  std::vector<double> tmp(ptr, ptr + in.size);
  std::vector<double> out;
  {
    py::gil_scoped_release nogil;
    out = fn(tmp, attrs_of(num_workers));
  }
  F64Array result(in.shape);
  std::copy(out.begin(), out.end(), result.mutable_data());
  return result;
}

template <typename Fn>
static void apply_inplace(F64Out& dest, const F64Array& src, int num_workers,
                          Fn fn, const char* where) {
  py::buffer_info out = dest.request(/*writable=*/true);
  py::buffer_info in  = src.request();
  Status st = Status::Ok;
  {
    py::gil_scoped_release nogil;
    st = fn(static_cast<double*>(out.ptr), static_cast<std::size_t>(out.size),
            static_cast<const double*>(in.ptr), static_cast<std::size_t>(in.size),
            attrs_of(num_workers));
  }
  throw_if_bad(st, where);
}

// ------------------------- module -------------------------
PYBIND11_MODULE(_logk, m) {
  m.doc() = "Logistic / logit kernels (scalar, allocating, in-place, threaded)";

  m.def("logistic", [](double x) { return logistic(x); }, py::arg("x"),
        "1 / (1 + exp(-x)); saturates to 0.0 / 1.0, never raises");
  m.def("logit", [](double p) { return logit(p); }, py::arg("p"),
        "log(p / (1 - p)); -inf at 0, +inf at 1, NaN outside [0,1]");

  m.def("logistic_vector",
    [](const F64Array& a, int num_workers) {
      return apply_vector(a, num_workers,
        [](const std::vector<double>& v, const MapAttrs& at) { return logistic_vector(v, at); });
    },
    py::arg("a"), py::arg("num_workers") = 0);

  m.def("logit_vector",
    [](const F64Array& a, int num_workers) {
      return apply_vector(a, num_workers,
        [](const std::vector<double>& v, const MapAttrs& at) { return logit_vector(v, at); });
    },
    py::arg("a"), py::arg("num_workers") = 0);

  m.def("logistic_inplace",
    [](F64Out dest, const F64Array& src, int num_workers) {
      apply_inplace(dest, src, num_workers,
        [](double* d, std::size_t nd, const double* s, std::size_t ns, const MapAttrs& at) {
          return logistic_inplace(d, nd, s, ns, at);
        }, "logistic_inplace");
    },
    py::arg("dest").noconvert(), py::arg("src"), py::arg("num_workers") = 0);

  m.def("logit_inplace",
    [](F64Out dest, const F64Array& src, int num_workers) {
      apply_inplace(dest, src, num_workers,
        [](double* d, std::size_t nd, const double* s, std::size_t ns, const MapAttrs& at) {
          return logit_inplace(d, nd, s, ns, at);
        }, "logit_inplace");
    },
    py::arg("dest").noconvert(), py::arg("src"), py::arg("num_workers") = 0);

  m.def("default_num_workers", &default_num_workers,
        "LOGK_NUM_THREADS if set to a positive integer, else hardware concurrency");
}
