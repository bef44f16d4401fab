// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bit_utils.hpp
 * @brief Bit manipulation for spin-configuration state indices.
 *
 * A state index encodes one local index per site (bit = 1 ↔ spin +1).
 */

#pragma once

#include "types.hpp"
#include <concepts>

namespace qsr {

/**
 * Test if bit at position pos is set.
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr bool test_bit(T x, int pos) noexcept {
    return (x >> pos) & 1;
}

/**
 * Set bit at position pos.
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr T set_bit(T x, int pos) noexcept {
    return x | (T{1} << pos);
}

} // namespace qsr
