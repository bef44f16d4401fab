// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file rotation.hpp
 * @brief Local basis rotations as products of single-site unitaries.
 *
 * A measurement in basis b is a projective measurement after applying
 *   U_b = ⊗_j u_j,   u_j ∈ {1, U_X, U_Y}.
 * The operator is stored as sparse single-site terms (one 2×2 matrix per
 * non-identity site) and never materialized as a 2^N × 2^N matrix.
 *
 * Connectivity of a configuration σ is row σ of U_b:
 *   {(σ', ⟨σ|U_b|σ'⟩) : ⟨σ|U_b|σ'⟩ ≠ 0}
 */

#pragma once

#include <qsr/hilbert/spin_space.hpp>
#include <qsr/utils/types.hpp>

#include <Eigen/Dense>

#include <cstddef>
#include <span>
#include <vector>

namespace qsr {

/** Single-site factor: u acting on `site`, identity elsewhere. */
struct SiteRotation {
    int site;
    Eigen::Matrix2cd u;
};

/** Connectivity of one configuration under a rotation. */
struct ConnRow {
    ConfigMatrix configs;   // Connected configurations σ'
    Eigen::VectorXcd mels;  // Matrix elements ⟨σ|U|σ'⟩

    [[nodiscard]] std::size_t size() const noexcept {
        return static_cast<std::size_t>(mels.size());
    }
};

/**
 * @class RotationOperator
 * @brief Tensor product of single-site unitaries on an n-site register.
 *
 * Default-constructed on n sites it is the identity. Terms are kept sorted
 * by site; at most one term per site.
 */
class RotationOperator {
public:
    /// Identity on n_sites sites.
    explicit RotationOperator(int n_sites);

    [[nodiscard]] int n_sites() const noexcept { return n_sites_; }

    /// Non-identity single-site factors, sorted by site.
    [[nodiscard]] std::span<const SiteRotation> terms() const noexcept { return terms_; }

    /// Upper bound on connected configurations: 2^(number of terms).
    [[nodiscard]] std::size_t max_conn_size() const noexcept {
        return std::size_t{1} << terms_.size();
    }

    /**
     * Right-multiply by a single-site factor: this ← this · term.
     * @throws std::invalid_argument if term.site ∉ [0, n_sites)
     */
    RotationOperator& operator*=(const SiteRotation& term);

    /**
     * Right-multiply by another rotation: this ← this · other.
     * @throws std::invalid_argument on site-count mismatch
     */
    RotationOperator& operator*=(const RotationOperator& other);

    /**
     * Row σ of the operator.
     *
     * The diagonal entry (σ itself) is always first; off-diagonal entries
     * follow in lexicographic order of target local indices over acted
     * sites (lowest site most significant). Zero off-diagonal entries are
     * dropped. The entry count varies per call; read ConnRow::size().
     *
     * @throws std::invalid_argument on length mismatch or non-±1 entries
     */
    [[nodiscard]] ConnRow get_conn(std::span<const f64> config) const;

    /// Element-wise equality of site terms.
    [[nodiscard]] bool operator==(const RotationOperator& other) const noexcept;

private:
    int n_sites_;
    std::vector<SiteRotation> terms_;
};

[[nodiscard]] inline RotationOperator operator*(RotationOperator lhs, const RotationOperator& rhs) {
    lhs *= rhs;
    return lhs;
}

} // namespace qsr
