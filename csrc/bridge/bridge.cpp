// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bridge.cpp
 * @brief Python-C++ nanobind bridge for QSR data preparation.
 *
 * Provides Python bindings for:
 *  - Measurement basis rotations (build, get_conn)
 *  - Dataset conversion into segmented connectivity arrays
 *  - Per-step batch composition with quantized padding
 *  - Segment sums
 */

#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <qsr/basis/basis_builder.hpp>
#include <qsr/basis/rotation.hpp>
#include <qsr/data/batch.hpp>
#include <qsr/data/conn_dataset.hpp>
#include <qsr/grad/segment_ops.hpp>
#include <qsr/utils/errors.hpp>

#include <complex>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

using qsr::ConfigMatrix;
using qsr::ConnDataset;
using qsr::RotationList;
using qsr::RotationOperator;
using qsr::i64;

using c128 = std::complex<double>;

// NumPy array type aliases
using ConfigArrayRO = nb::ndarray<const double, nb::ndim<2>, nb::c_contig, nb::device::cpu>;
using F64VecRO      = nb::ndarray<const double, nb::shape<-1>, nb::c_contig, nb::device::cpu>;
using C128VecRO     = nb::ndarray<const c128, nb::shape<-1>, nb::c_contig, nb::device::cpu>;
using I64VecRO      = nb::ndarray<const int64_t, nb::shape<-1>, nb::c_contig, nb::device::cpu>;
using ConfigArrayOut = nb::ndarray<double, nb::numpy, nb::ndim<2>>;
using F64VecOut     = nb::ndarray<double, nb::numpy, nb::shape<-1>>;
using C128VecOut    = nb::ndarray<c128, nb::numpy, nb::shape<-1>>;
using I64VecOut     = nb::ndarray<int64_t, nb::numpy, nb::shape<-1>>;

// Python ↔ C++ conversion utilities
[[nodiscard]] inline ConfigMatrix to_config_matrix(ConfigArrayRO arr) {
    const auto rows = static_cast<Eigen::Index>(arr.shape(0));
    const auto cols = static_cast<Eigen::Index>(arr.shape(1));
    return Eigen::Map<const ConfigMatrix>(arr.data(), rows, cols);
}

[[nodiscard]] inline std::span<const double> as_span(F64VecRO arr) {
    return {arr.data(), arr.shape(0)};
}

[[nodiscard]] inline std::span<const i64> as_span(I64VecRO arr) {
    return {arr.data(), arr.shape(0)};
}

template<typename T>
[[nodiscard]] inline nb::capsule make_owner(T* p) {
    return nb::capsule(p, [](void* ptr) noexcept {
        delete[] static_cast<T*>(ptr);
    });
}

[[nodiscard]] inline ConfigArrayOut from_config_matrix(const ConfigMatrix& m) {
    const size_t R = static_cast<size_t>(m.rows());
    const size_t C = static_cast<size_t>(m.cols());
    auto* data = new double[R * C];
    if (R * C > 0) std::memcpy(data, m.data(), R * C * sizeof(double));
    return ConfigArrayOut(data, {R, C}, make_owner(data));
}

[[nodiscard]] inline C128VecOut from_complex_vector(const Eigen::VectorXcd& v) {
    const size_t N = static_cast<size_t>(v.size());
    auto* data = new c128[N];
    if (N > 0) std::memcpy(data, v.data(), N * sizeof(c128));
    return C128VecOut(data, {N}, make_owner(data));
}

template<typename T>
[[nodiscard]] inline nb::ndarray<T, nb::numpy, nb::shape<-1>> from_vector(const std::vector<T>& xs) {
    const size_t N = xs.size();
    auto* data = new T[N];
    if (N > 0) std::memcpy(data, xs.data(), N * sizeof(T));
    return nb::ndarray<T, nb::numpy, nb::shape<-1>>(data, {N}, make_owner(data));
}

[[nodiscard]] inline I64VecOut from_offsets(const std::vector<i64>& secs) {
    const size_t N = secs.size();
    auto* data = new int64_t[N];
    for (size_t i = 0; i < N; ++i) data[i] = static_cast<int64_t>(secs[i]);
    return I64VecOut(data, {N}, make_owner(data));
}

// Bases sequence (list, tuple or 1-D ndarray): either all str descriptors
// or all RotationOperator objects
[[nodiscard]] RotationList to_rotation_list(const nb::handle& bases) {
    if (!nb::isinstance<nb::sequence>(bases) || nb::isinstance<nb::str>(bases) ||
        nb::isinstance<nb::bytes>(bases)) {
        throw nb::value_error("convert_data: bases must be a list or ndarray");
    }

    // ndarray iteration yields fresh element objects; hold references
    std::vector<nb::object> items;
    for (nb::handle h : bases) items.push_back(nb::borrow(h));
    if (items.empty()) {
        throw std::invalid_argument("convert_data: bases list is empty");
    }

    if (nb::isinstance<nb::str>(items.front())) {
        std::vector<std::string> labels;
        labels.reserve(items.size());
        for (const auto& h : items) {
            if (!nb::isinstance<nb::str>(h)) {
                throw qsr::TypeError("convert_data: mixed basis element types in list");
            }
            labels.push_back(nb::cast<std::string>(h));
        }
        return qsr::check_bases(std::span<const std::string>(labels));
    }

    if (nb::isinstance<RotationOperator>(items.front())) {
        RotationList ops;
        ops.reserve(items.size());
        for (const auto& h : items) {
            if (!nb::isinstance<RotationOperator>(h)) {
                throw qsr::TypeError("convert_data: mixed basis element types in list");
            }
            ops.push_back(nb::cast<std::shared_ptr<RotationOperator>>(h));
        }
        return qsr::check_bases(std::move(ops));
    }

    throw qsr::TypeError("convert_data: unknown basis element type, expected str or RotationOperator");
}

[[nodiscard]] inline nb::dict from_dataset(const ConnDataset& d) {
    nb::dict out;
    out["sigma_p"] = from_config_matrix(d.sigma_p);
    out["mels"]    = from_complex_vector(d.mels);
    out["secs"]    = from_offsets(d.secs);
    out["max_len"] = d.max_len;
    return out;
}

// Module definition
NB_MODULE(_qsr_cpp, m) {
    m.doc() = "QSR C++ core bridge";

    nb::register_exception_translator(
        [](const std::exception_ptr& p, void*) {
            try {
                std::rethrow_exception(p);
            } catch (const qsr::TypeError& e) {
                PyErr_SetString(PyExc_TypeError, e.what());
            } catch (const qsr::NotImplementedError& e) {
                PyErr_SetString(PyExc_NotImplementedError, e.what());
            }
        });

    // Basis rotations
    nb::class_<RotationOperator>(m, "RotationOperator",
                                 "Tensor product of single-site measurement unitaries")
        .def_prop_ro("n_sites", &RotationOperator::n_sites)
        .def_prop_ro("max_conn_size", &RotationOperator::max_conn_size)
        .def("get_conn",
             [](const RotationOperator& op, F64VecRO sigma) -> nb::dict {
                 const auto row = op.get_conn(as_span(sigma));
                 nb::dict d;
                 d["configs"] = from_config_matrix(row.configs);
                 d["mels"]    = from_complex_vector(row.mels);
                 return d;
             },
             "sigma"_a,
             "Connected configurations and matrix elements of row sigma.")
        .def("__eq__", [](const RotationOperator& a, const RotationOperator& b) { return a == b; })
        .def("__mul__", [](const RotationOperator& a, const RotationOperator& b) {
            return std::make_shared<RotationOperator>(a * b);
        });

    m.def("build_rotation",
          [](const std::string& basis, int n_sites) {
              return std::make_shared<RotationOperator>(qsr::build_rotation(basis, n_sites));
          },
          "basis"_a, "n_sites"_a,
          "Build the rotation for a descriptor over {X, Y, Z, I}.");

    // Dataset conversion
    m.def("convert_data",
          [](ConfigArrayRO samples, nb::handle bases) -> nb::dict {
              const auto ops = to_rotation_list(bases);
              ConnDataset d;
              {
                  nb::gil_scoped_release release;
                  d = qsr::convert_data(to_config_matrix(samples), ops);
              }
              return from_dataset(d);
          },
          "samples"_a, "bases"_a,
          "Expand measurement records into (sigma_p, mels, secs, max_len).");

    m.def("convert_training_data",
          [](nb::handle training_data) -> nb::dict {
              if (!nb::isinstance<nb::tuple>(training_data) || nb::len(training_data) != 2) {
                  throw qsr::TypeError(
                      "convert_training_data: training_data must be a (samples, bases) tuple");
              }
              const auto pair = nb::borrow<nb::tuple>(training_data);
              const auto samples = nb::cast<ConfigArrayRO>(pair[0]);
              const auto ops = to_rotation_list(pair[1]);
              ConnDataset d;
              {
                  nb::gil_scoped_release release;
                  d = qsr::convert_data(to_config_matrix(samples), ops);
              }
              return from_dataset(d);
          },
          "training_data"_a,
          "convert_data on a (samples, bases) tuple.");

    // Batch composition
    m.def("compose_sampled_data",
          [](ConfigArrayRO sigma_p, C128VecRO mels, I64VecRO secs, int64_t max_len,
             I64VecRO sampled_indices, int64_t min_padding_factor) -> nb::dict {
              // Borrow the dataset buffers in place; only sampled segments are copied
              const Eigen::Map<const ConfigMatrix> sp(
                  sigma_p.data(),
                  static_cast<Eigen::Index>(sigma_p.shape(0)),
                  static_cast<Eigen::Index>(sigma_p.shape(1)));
              const Eigen::Map<const Eigen::VectorXcd> mv(
                  mels.data(), static_cast<Eigen::Index>(mels.shape(0)));
              const qsr::ConnDatasetView data{sp, mv, as_span(secs), max_len};

              qsr::Batch batch;
              {
                  nb::gil_scoped_release release;
                  batch = qsr::compose_sampled_data(data, as_span(sampled_indices),
                                                    min_padding_factor);
              }

              nb::dict out;
              out["sigma_p"] = from_config_matrix(batch.sigma_p);
              out["mels"]    = from_complex_vector(batch.mels);
              out["secs"]    = from_offsets(batch.secs);
              out["max_len"] = batch.max_len;
              return out;
          },
          "sigma_p"_a, "mels"_a, "secs"_a, "max_len"_a, "sampled_indices"_a,
          "min_padding_factor"_a = qsr::DEFAULT_PADDING_GRANULARITY,
          "Gather sorted record indices into a padded training batch.\n"
          "  max_len: longest segment of the dataset; longer sampled segments are rejected\n"
          "  min_padding_factor: batch length is rounded up to a multiple of it");

    // Segment reductions
    m.def("sum_sections",
          [](C128VecRO arr, I64VecRO secs) -> C128VecOut {
              const std::span<const c128> a(arr.data(), arr.shape(0));
              return from_vector(qsr::sum_sections<c128>(a, as_span(secs)));
          },
          "arr"_a, "secs"_a,
          "Per-segment sums of a complex array.");

    m.def("sum_sections",
          [](F64VecRO arr, I64VecRO secs) -> F64VecOut {
              return from_vector(qsr::sum_sections<double>(as_span(arr), as_span(secs)));
          },
          "arr"_a, "secs"_a,
          "Per-segment sums of a real array.");
}
