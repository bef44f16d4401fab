// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file batch.hpp
 * @brief Random minibatches of segmented connectivity data.
 *
 * A Batch is a self-contained copy of the segments of a sampled subset of
 * records. Buffer lengths are rounded up to a multiple of a fixed
 * granularity so downstream compiled kernels see few distinct shapes:
 *   len(sigma_p) = g · ⌈total / g⌉
 * Rows in [total, len) are zero (coefficient 0).
 */

#pragma once

#include <qsr/data/conn_dataset.hpp>
#include <qsr/parallel/communicator.hpp>
#include <qsr/utils/constants.hpp>
#include <qsr/utils/types.hpp>

#include <optional>
#include <random>
#include <span>
#include <vector>

namespace qsr {

struct Batch {
    ConfigMatrix sigma_p;    // [padded, n_sites]
    Eigen::VectorXcd mels;   // [padded]
    std::vector<i64> secs;   // [n_segments + 1], secs[0] == 0
    i64 max_len = 0;         // Longest segment in this batch
    i64 total_len = 0;       // Rows actually copied (== secs.back())

    [[nodiscard]] std::size_t n_segments() const noexcept {
        return secs.empty() ? 0 : secs.size() - 1;
    }
};

/**
 * Per-worker RNG stream derived from a root seed.
 *
 * Streams for distinct ranks are decorrelated by SplitMix64 mixing of
 * (root, rank). Without a seed the root is drawn from std::random_device.
 */
[[nodiscard]] std::mt19937_64 make_worker_rng(std::optional<u64> seed, const Communicator& comm);

/**
 * Draw batch_size record indices uniformly with replacement, sorted.
 * @throws std::invalid_argument if n_records <= 0 or batch_size <= 0
 */
[[nodiscard]] std::vector<i64> sample_indices(std::mt19937_64& rng, i64 n_records, i64 batch_size);

/**
 * Copy the segments of `sampled_indices` into a fresh padded batch.
 *
 * Only the sampled segments are read, so the cost is O(batch) however
 * large the dataset is. Padding depends on the granularity alone.
 *
 * @param sampled_indices  Ascending record indices (repeats allowed)
 * @param padding_granularity  Buffer length quantum g > 0
 * @throws std::invalid_argument on unsorted/out-of-range indices, g <= 0,
 *         a sampled segment that is malformed or longer than data.max_len,
 *         or sigma_p / mels row counts that differ
 */
[[nodiscard]] Batch compose_sampled_data(
    const ConnDatasetView& data,
    std::span<const i64> sampled_indices,
    i64 padding_granularity = DEFAULT_PADDING_GRANULARITY
);

[[nodiscard]] inline Batch compose_sampled_data(
    const ConnDataset& data,
    std::span<const i64> sampled_indices,
    i64 padding_granularity = DEFAULT_PADDING_GRANULARITY
) {
    return compose_sampled_data(data.view(), sampled_indices, padding_granularity);
}

} // namespace qsr
