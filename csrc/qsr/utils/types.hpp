// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file types.hpp
 * @brief Platform-independent scalar aliases and compatibility checks.
 *
 * Fixed-width integer/float/complex types shared by the data pipeline,
 * the gradient kernels and the Python/XLA bridges. Enforces the
 * little-endian layout required for zero-copy exchange with JAX buffers.
 */

#pragma once

#include <bit>
#include <complex>
#include <cstddef>
#include <cstdint>

namespace qsr {

// Unsigned integers - seeds and state indices
using u8  = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// Signed integers - offsets and record indices
using i32 = std::int32_t;
using i64 = std::int64_t;

// Floating-point
using f32 = float;
using f64 = double;

// Complex amplitudes and matrix elements
using c64  = std::complex<f32>;
using c128 = std::complex<f64>;

static_assert(sizeof(f64) == 8, "64-bit double required");
static_assert(sizeof(c128) == 16, "packed complex<double> required");
static_assert(std::endian::native == std::endian::little,
              "Little-endian required for JAX/XLA compatibility");

} // namespace qsr
