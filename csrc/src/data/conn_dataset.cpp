// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file conn_dataset.cpp
 * @brief Two-pass dataset conversion into segmented connectivity arrays.
 *
 * Pass 1 expands records independently (parallel), a prefix sum fixes the
 * offsets, pass 2 copies rows into buffers allocated once at final size.
 */

#include <qsr/data/conn_dataset.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace qsr {

ConnDataset convert_data(const ConfigMatrix& samples, const RotationList& bases) {
    const std::size_t n = static_cast<std::size_t>(samples.rows());
    if (n != bases.size()) {
        throw std::invalid_argument(std::format(
            "convert_data: {} samples but {} measurement bases", n, bases.size()));
    }

    const RotationList ops = check_bases(bases);
    const int n_sites = ops.front()->n_sites();
    if (samples.cols() != n_sites) {
        throw std::invalid_argument(std::format(
            "convert_data: samples have {} sites, bases act on {}", samples.cols(), n_sites));
    }

    // Validate up front: get_conn must not throw inside the parallel region
    for (Eigen::Index i = 0; i < samples.rows(); ++i) {
        for (Eigen::Index j = 0; j < samples.cols(); ++j) {
            const f64 s = samples(i, j);
            if (s != LOCAL_STATES[0] && s != LOCAL_STATES[1]) {
                throw std::invalid_argument(std::format(
                    "convert_data: sample {} site {} has value {}, expected ±1", i, j, s));
            }
        }
    }

    std::vector<ConnRow> rows(n);

#pragma omp parallel for schedule(dynamic, 64)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(n); ++i) {
        const auto r = samples.row(i);
        rows[static_cast<std::size_t>(i)] = ops[static_cast<std::size_t>(i)]->get_conn(
            std::span<const f64>(r.data(), static_cast<std::size_t>(n_sites)));
    }

    ConnDataset out;
    out.secs.resize(n + 1);
    i64 total = 0;
    for (std::size_t i = 0; i < n; ++i) {
        out.secs[i] = total;
        const auto len = static_cast<i64>(rows[i].size());
        total += len;
        out.max_len = std::max(out.max_len, len);
    }
    out.secs[n] = total;

    const auto n_rows = static_cast<Eigen::Index>(total + out.max_len);
    out.sigma_p = ConfigMatrix::Zero(n_rows, n_sites);
    out.mels = Eigen::VectorXcd::Zero(n_rows);

#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(n); ++i) {
        const auto& row = rows[static_cast<std::size_t>(i)];
        const auto start = static_cast<Eigen::Index>(out.secs[static_cast<std::size_t>(i)]);
        const auto len = static_cast<Eigen::Index>(row.size());
        out.sigma_p.middleRows(start, len) = row.configs;
        out.mels.segment(start, len) = row.mels;
    }

    spdlog::debug("convert_data: {} records, {} connected rows, max_len={}",
                  n, total, out.max_len);
    return out;
}

ConnDataset convert_data(const ConfigMatrix& samples, std::span<const std::string> bases) {
    if (static_cast<std::size_t>(samples.rows()) != bases.size()) {
        throw std::invalid_argument(std::format(
            "convert_data: {} samples but {} measurement bases", samples.rows(), bases.size()));
    }
    return convert_data(samples, check_bases(bases));
}

} // namespace qsr
