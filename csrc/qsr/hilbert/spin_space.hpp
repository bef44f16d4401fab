// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file spin_space.hpp
 * @brief Spin-1/2 configuration space and row-major configuration blocks.
 *
 * A configuration is a row of local eigenvalues σ_j ∈ {-1, +1}. Local index
 * 0 ↔ -1 and 1 ↔ +1, which fixes the row/column order of every single-site
 * rotation matrix. State indices place site 0 in the most significant bit.
 */

#pragma once

#include <qsr/utils/types.hpp>

#include <Eigen/Dense>

#include <span>

namespace qsr {

/// Row-major block of configurations: one configuration per row.
using ConfigMatrix = Eigen::Matrix<f64, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Local eigenvalues ordered by local index.
inline constexpr f64 LOCAL_STATES[2] = {-1.0, 1.0};

/**
 * Map local eigenvalue to local index.
 * @throws std::invalid_argument if s is not ±1
 */
[[nodiscard]] int local_index(f64 s);

/**
 * @class SpinSpace
 * @brief Full configuration space of n spin-1/2 sites.
 *
 * Enumeration is exponential in n_sites; intended for exact normalization
 * on small systems only.
 */
class SpinSpace {
public:
    /**
     * @param n_sites  Number of sites (1..MAX_SITES)
     * @throws std::invalid_argument Invalid site count
     */
    explicit SpinSpace(int n_sites);

    [[nodiscard]] int n_sites() const noexcept { return n_sites_; }

    /// Total state count 2^n_sites.
    [[nodiscard]] u64 n_states() const noexcept { return u64{1} << n_sites_; }

    /// Decode state index into a configuration row.
    void state_to_config(u64 idx, std::span<f64> row) const noexcept;

    /// Encode configuration row into a state index.
    [[nodiscard]] u64 config_to_state(std::span<const f64> row) const;

    /**
     * Enumerate states [begin, begin + count) as configuration rows.
     * Ranges past n_states() are clipped.
     */
    [[nodiscard]] ConfigMatrix states(u64 begin, u64 count) const;

    /// Enumerate the complete space.
    [[nodiscard]] ConfigMatrix all_states() const { return states(0, n_states()); }

private:
    int n_sites_;
};

} // namespace qsr
