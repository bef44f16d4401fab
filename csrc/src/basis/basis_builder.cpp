// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file basis_builder.cpp
 * @brief Descriptor parsing and per-conversion rotation caching.
 */

#include <qsr/basis/basis_builder.hpp>
#include <qsr/utils/errors.hpp>

#include <cmath>
#include <format>
#include <stdexcept>

namespace qsr {

namespace {

const double kInvSqrt2 = 1.0 / std::sqrt(2.0);

Eigen::Matrix2cd make_rotation_x() {
    Eigen::Matrix2cd u;
    u << 1.0, 1.0,
         1.0, -1.0;
    return kInvSqrt2 * u;
}

Eigen::Matrix2cd make_rotation_y() {
    const c128 i{0.0, 1.0};
    Eigen::Matrix2cd u;
    u << 1.0, -i,
         1.0, i;
    return kInvSqrt2 * u;
}

} // anonymous namespace

const Eigen::Matrix2cd& rotation_x() noexcept {
    static const Eigen::Matrix2cd u = make_rotation_x();
    return u;
}

const Eigen::Matrix2cd& rotation_y() noexcept {
    static const Eigen::Matrix2cd u = make_rotation_y();
    return u;
}

RotationOperator build_rotation(std::string_view basis, int n_sites) {
    if (static_cast<int>(basis.size()) != n_sites) {
        throw TypeError(std::format(
            "build_rotation: basis '{}' has {} labels, expected {}", basis, basis.size(), n_sites));
    }

    RotationOperator op(n_sites);
    for (int j = 0; j < n_sites; ++j) {
        switch (basis[j]) {
            case 'X': op *= SiteRotation{j, rotation_x()}; break;
            case 'Y': op *= SiteRotation{j, rotation_y()}; break;
            case 'Z':
            case 'I': break;
            default:
                throw TypeError(std::format(
                    "build_rotation: unknown label '{}' at site {} in basis '{}'",
                    basis[j], j, basis));
        }
    }
    return op;
}

std::shared_ptr<const RotationOperator> RotationCache::get(const std::string& basis) {
    if (auto it = cache_.find(basis); it != cache_.end()) {
        return it->second;
    }
    auto op = std::make_shared<const RotationOperator>(build_rotation(basis, n_sites_));
    cache_.emplace(basis, op);
    return op;
}

RotationList check_bases(std::span<const std::string> bases) {
    if (bases.empty()) {
        throw std::invalid_argument("check_bases: empty list of measurement bases");
    }

    RotationCache cache(static_cast<int>(bases.front().size()));
    RotationList out;
    out.reserve(bases.size());
    for (const auto& b : bases) {
        out.push_back(cache.get(b));
    }
    return out;
}

RotationList check_bases(RotationList bases) {
    if (bases.empty()) {
        throw std::invalid_argument("check_bases: empty list of measurement bases");
    }
    if (!bases.front()) {
        throw std::invalid_argument("check_bases: null rotation operator at index 0");
    }

    const int n_sites = bases.front()->n_sites();
    for (std::size_t i = 0; i < bases.size(); ++i) {
        if (!bases[i]) {
            throw std::invalid_argument(
                std::format("check_bases: null rotation operator at index {}", i));
        }
        if (bases[i]->n_sites() != n_sites) {
            throw std::invalid_argument(std::format(
                "check_bases: operator {} acts on {} sites, expected {}",
                i, bases[i]->n_sites(), n_sites));
        }
    }
    return bases;
}

} // namespace qsr
