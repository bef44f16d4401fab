// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file spin_space.cpp
 * @brief Spin-1/2 state index ↔ configuration conversion and enumeration.
 */

#include <qsr/hilbert/spin_space.hpp>
#include <qsr/utils/bit_utils.hpp>
#include <qsr/utils/constants.hpp>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace qsr {

int local_index(f64 s) {
    if (s == LOCAL_STATES[1]) return 1;
    if (s == LOCAL_STATES[0]) return 0;
    throw std::invalid_argument(
        std::format("local_index: {} is not a spin-1/2 eigenvalue (±1)", s));
}

SpinSpace::SpinSpace(int n_sites) : n_sites_(n_sites) {
    if (n_sites <= 0 || n_sites > MAX_SITES) {
        throw std::invalid_argument(
            std::format("SpinSpace: n_sites={} out of range [1,{}]", n_sites, MAX_SITES));
    }
}

void SpinSpace::state_to_config(u64 idx, std::span<f64> row) const noexcept {
    for (int j = 0; j < n_sites_; ++j) {
        row[j] = LOCAL_STATES[test_bit(idx, n_sites_ - 1 - j) ? 1 : 0];
    }
}

u64 SpinSpace::config_to_state(std::span<const f64> row) const {
    if (static_cast<int>(row.size()) != n_sites_) {
        throw std::invalid_argument(
            std::format("SpinSpace: configuration length {} != n_sites {}", row.size(), n_sites_));
    }
    u64 idx = 0;
    for (int j = 0; j < n_sites_; ++j) {
        if (local_index(row[j]) == 1) idx = set_bit(idx, n_sites_ - 1 - j);
    }
    return idx;
}

ConfigMatrix SpinSpace::states(u64 begin, u64 count) const {
    const u64 total = n_states();
    const u64 first = std::min(begin, total);
    const u64 n = std::min(count, total - first);

    ConfigMatrix out(static_cast<Eigen::Index>(n), n_sites_);

#pragma omp parallel for schedule(static) if(n > 1024)
    for (std::ptrdiff_t r = 0; r < static_cast<std::ptrdiff_t>(n); ++r) {
        state_to_config(first + static_cast<u64>(r),
                        std::span<f64>(out.row(r).data(), static_cast<std::size_t>(n_sites_)));
    }
    return out;
}

} // namespace qsr
