// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file constants.hpp
 * @brief Framework-wide compile-time constants.
 */

#pragma once

#include "types.hpp"

namespace qsr {

/**
 * Maximum number of sites addressable by a u64 state index.
 * Bit 63 is kept free so 2^n_sites stays representable.
 */
inline constexpr int MAX_SITES = 63;

/**
 * Default granularity for batch buffer sizes.
 * Composed batches are padded to a multiple of this value so the number of
 * distinct shapes seen by compiled kernels stays small.
 */
inline constexpr i64 DEFAULT_PADDING_GRANULARITY = 128;

/**
 * Default upper bound on site count for exact normalization in nll().
 * 2^24 log-amplitude evaluations is the largest enumeration allowed
 * without raising DriverConfig::nll_max_sites.
 */
inline constexpr int DEFAULT_NLL_MAX_SITES = 24;

/// Configurations evaluated per chunk while enumerating the full space.
inline constexpr i64 ENUM_CHUNK_SIZE = 4096;

} // namespace qsr
