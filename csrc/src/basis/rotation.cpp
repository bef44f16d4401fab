// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file rotation.cpp
 * @brief Product-operator algebra and row connectivity for basis rotations.
 */

#include <qsr/basis/rotation.hpp>
#include <qsr/utils/constants.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <stdexcept>

namespace qsr {

RotationOperator::RotationOperator(int n_sites) : n_sites_(n_sites) {
    if (n_sites <= 0 || n_sites > MAX_SITES) {
        throw std::invalid_argument(
            std::format("RotationOperator: n_sites={} out of range [1,{}]", n_sites, MAX_SITES));
    }
}

RotationOperator& RotationOperator::operator*=(const SiteRotation& term) {
    if (term.site < 0 || term.site >= n_sites_) {
        throw std::invalid_argument(
            std::format("RotationOperator: site {} out of range [0,{})", term.site, n_sites_));
    }

    auto it = std::lower_bound(terms_.begin(), terms_.end(), term.site,
                               [](const SiteRotation& t, int s) { return t.site < s; });
    if (it != terms_.end() && it->site == term.site) {
        it->u = (it->u * term.u).eval();
    } else {
        terms_.insert(it, term);
    }
    return *this;
}

RotationOperator& RotationOperator::operator*=(const RotationOperator& other) {
    if (other.n_sites_ != n_sites_) {
        throw std::invalid_argument(
            std::format("RotationOperator: cannot multiply {}-site and {}-site operators",
                        n_sites_, other.n_sites_));
    }
    for (const auto& t : other.terms_) *this *= t;
    return *this;
}

bool RotationOperator::operator==(const RotationOperator& other) const noexcept {
    if (n_sites_ != other.n_sites_ || terms_.size() != other.terms_.size()) return false;
    for (std::size_t k = 0; k < terms_.size(); ++k) {
        if (terms_[k].site != other.terms_[k].site) return false;
        if (terms_[k].u != other.terms_[k].u) return false;
    }
    return true;
}

ConnRow RotationOperator::get_conn(std::span<const f64> config) const {
    if (static_cast<int>(config.size()) != n_sites_) {
        throw std::invalid_argument(
            std::format("get_conn: configuration length {} != n_sites {}", config.size(), n_sites_));
    }

    const std::size_t k = terms_.size();
    std::vector<int> row_idx(k);
    c128 diag{1.0, 0.0};
    for (std::size_t t = 0; t < k; ++t) {
        row_idx[t] = local_index(config[terms_[t].site]);
        diag *= terms_[t].u(row_idx[t], row_idx[t]);
    }
    // Untouched sites must still be valid eigenvalues
    for (const f64 s : config) (void)local_index(s);

    const std::size_t n_comb = max_conn_size();
    ConnRow out;
    out.configs.resize(static_cast<Eigen::Index>(n_comb), n_sites_);
    out.mels.resize(static_cast<Eigen::Index>(n_comb));

    const Eigen::Map<const Eigen::RowVectorXd> sigma(config.data(), n_sites_);
    out.configs.row(0) = sigma;
    out.mels(0) = diag;
    Eigen::Index n = 1;

    for (std::size_t c = 0; c < n_comb; ++c) {
        // Column local index of term t is bit (k-1-t) of c
        c128 mel{1.0, 0.0};
        bool is_diag = true;
        for (std::size_t t = 0; t < k; ++t) {
            const int col = static_cast<int>((c >> (k - 1 - t)) & 1u);
            is_diag = is_diag && (col == row_idx[t]);
            mel *= terms_[t].u(row_idx[t], col);
        }
        if (is_diag || mel == c128{0.0, 0.0}) continue;

        out.configs.row(n) = sigma;
        for (std::size_t t = 0; t < k; ++t) {
            const int col = static_cast<int>((c >> (k - 1 - t)) & 1u);
            out.configs(n, terms_[t].site) = LOCAL_STATES[col];
        }
        out.mels(n) = mel;
        ++n;
    }

    out.configs.conservativeResize(n, Eigen::NoChange);
    out.mels.conservativeResize(n);
    return out;
}

} // namespace qsr
