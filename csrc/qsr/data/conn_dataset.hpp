// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file conn_dataset.hpp
 * @brief Segmented connected-configuration representation of a dataset.
 *
 * For N measurement records (σ_i, U_i) the connectivity rows
 *   {(σ', ⟨σ_i|U_i|σ'⟩)}
 * are concatenated in CSR-like layout: record i owns rows
 * [secs[i], secs[i+1]) of sigma_p / mels.
 *
 * Layout invariants:
 *   secs.size() == N + 1, secs[0] == 0, secs non-decreasing
 *   secs[N] == total number of connected rows
 *   sigma_p / mels carry max_len extra zero rows after secs[N], so any
 *   window of max_len rows starting at a valid offset stays in bounds.
 *
 * Built once at load time; read-only afterwards.
 */

#pragma once

#include <qsr/basis/basis_builder.hpp>
#include <qsr/hilbert/spin_space.hpp>
#include <qsr/utils/types.hpp>

#include <Eigen/Dense>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace qsr {

/**
 * Non-owning view of segmented connectivity arrays.
 *
 * Lets batch composition read buffers owned elsewhere (a ConnDataset, or
 * arrays handed over from Python) without copying them.
 */
struct ConnDatasetView {
    Eigen::Ref<const ConfigMatrix> sigma_p;
    Eigen::Ref<const Eigen::VectorXcd> mels;
    std::span<const i64> secs;
    i64 max_len = 0;         // Upper bound on any segment length

    [[nodiscard]] std::size_t n_records() const noexcept {
        return secs.empty() ? 0 : secs.size() - 1;
    }
    [[nodiscard]] int n_sites() const noexcept {
        return static_cast<int>(sigma_p.cols());
    }
};

struct ConnDataset {
    ConfigMatrix sigma_p;    // [total + max_len, n_sites]
    Eigen::VectorXcd mels;   // [total + max_len]
    std::vector<i64> secs;   // [n_records + 1]
    i64 max_len = 0;         // Longest segment

    [[nodiscard]] std::size_t n_records() const noexcept {
        return secs.empty() ? 0 : secs.size() - 1;
    }
    [[nodiscard]] i64 total_len() const noexcept {
        return secs.empty() ? 0 : secs.back();
    }
    [[nodiscard]] int n_sites() const noexcept {
        return static_cast<int>(sigma_p.cols());
    }

    [[nodiscard]] ConnDatasetView view() const {
        return {sigma_p, mels, secs, max_len};
    }
};

/**
 * Expand every record into its connected configurations.
 *
 * @param samples  Measured configurations, one record per row
 * @param bases    One rotation per record (see check_bases)
 * @throws std::invalid_argument if samples.rows() != bases.size(), the
 *         site counts disagree, or a sample is not a ±1 configuration
 */
[[nodiscard]] ConnDataset convert_data(const ConfigMatrix& samples, const RotationList& bases);

/// Descriptor overload: compiles bases via check_bases first.
[[nodiscard]] ConnDataset convert_data(const ConfigMatrix& samples,
                                       std::span<const std::string> bases);

} // namespace qsr
