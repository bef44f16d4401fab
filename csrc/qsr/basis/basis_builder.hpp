// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file basis_builder.hpp
 * @brief Compile basis descriptors into rotation operators.
 *
 * A descriptor is a string with one label per site:
 *   'X' → U_X = (1/√2)[[1, 1], [1, -1]]
 *   'Y' → U_Y = (1/√2)[[1, -i], [1, i]]
 *   'Z', 'I' → identity
 *
 * Datasets reuse a handful of distinct bases, so descriptors are compiled
 * once per distinct value and shared by pointer.
 */

#pragma once

#include <qsr/basis/rotation.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace qsr {

/// One rotation per measurement record; equal descriptors share a pointer.
using RotationList = std::vector<std::shared_ptr<const RotationOperator>>;

/// Fixed single-site unitaries.
[[nodiscard]] const Eigen::Matrix2cd& rotation_x() noexcept;
[[nodiscard]] const Eigen::Matrix2cd& rotation_y() noexcept;

/**
 * Build U_b for descriptor `basis` on n_sites sites.
 * @throws TypeError if basis.size() != n_sites or a label is unknown
 */
[[nodiscard]] RotationOperator build_rotation(std::string_view basis, int n_sites);

/**
 * Descriptor → operator map, filled lazily and queried by value.
 *
 * Entries are never replaced once inserted. Scoped to a single conversion;
 * not thread-safe for concurrent get().
 */
class RotationCache {
public:
    explicit RotationCache(int n_sites) : n_sites_(n_sites) {}

    /// Return the cached operator for `basis`, building it on first use.
    [[nodiscard]] std::shared_ptr<const RotationOperator> get(const std::string& basis);

    [[nodiscard]] std::size_t size() const noexcept { return cache_.size(); }

private:
    int n_sites_;
    std::unordered_map<std::string, std::shared_ptr<const RotationOperator>> cache_;
};

/**
 * Compile one descriptor per record.
 *
 * Site count is taken from the first descriptor.
 * @throws std::invalid_argument on empty input
 * @throws TypeError on malformed descriptors
 */
[[nodiscard]] RotationList check_bases(std::span<const std::string> bases);

/**
 * Validate prebuilt operators.
 * @throws std::invalid_argument on empty input, null entries, or
 *         inconsistent site counts
 */
[[nodiscard]] RotationList check_bases(RotationList bases);

} // namespace qsr
