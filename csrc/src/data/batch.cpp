// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file batch.cpp
 * @brief Minibatch sampling and quantized segment composition.
 */

#include <qsr/data/batch.hpp>

#include <algorithm>
#include <format>
#include <stdexcept>

namespace qsr {

namespace {

// SplitMix64 finalizer
constexpr u64 splitmix64(u64 x) noexcept {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

} // anonymous namespace

std::mt19937_64 make_worker_rng(std::optional<u64> seed, const Communicator& comm) {
    u64 root = 0;
    if (seed) {
        root = *seed;
    } else {
        std::random_device rd;
        root = (static_cast<u64>(rd()) << 32) ^ static_cast<u64>(rd());
    }
    const u64 key = splitmix64(splitmix64(root) ^ static_cast<u64>(comm.rank()));
    std::seed_seq seq{static_cast<u32>(key), static_cast<u32>(key >> 32),
                      static_cast<u32>(comm.rank()), static_cast<u32>(comm.size())};
    return std::mt19937_64(seq);
}

std::vector<i64> sample_indices(std::mt19937_64& rng, i64 n_records, i64 batch_size) {
    if (n_records <= 0) {
        throw std::invalid_argument("sample_indices: no records to sample from");
    }
    if (batch_size <= 0) {
        throw std::invalid_argument(
            std::format("sample_indices: batch_size={} must be positive", batch_size));
    }

    std::uniform_int_distribution<i64> dist(0, n_records - 1);
    std::vector<i64> idx(static_cast<std::size_t>(batch_size));
    for (auto& i : idx) i = dist(rng);
    std::sort(idx.begin(), idx.end());
    return idx;
}

Batch compose_sampled_data(
    const ConnDatasetView& data,
    std::span<const i64> sampled_indices,
    i64 padding_granularity
) {
    if (padding_granularity <= 0) {
        throw std::invalid_argument(std::format(
            "compose_sampled_data: padding_granularity={} must be positive", padding_granularity));
    }
    if (data.sigma_p.rows() != data.mels.size()) {
        throw std::invalid_argument(std::format(
            "compose_sampled_data: sigma_p has {} rows, mels has {}",
            data.sigma_p.rows(), data.mels.size()));
    }

    const auto n_rec = static_cast<i64>(data.n_records());
    const auto n_rows = static_cast<i64>(data.mels.size());
    const std::size_t n = sampled_indices.size();

    Batch out;
    out.secs.assign(n + 1, 0);

    i64 prev = 0;
    for (std::size_t k = 0; k < n; ++k) {
        const i64 i = sampled_indices[k];
        if (i < 0 || i >= n_rec) {
            throw std::invalid_argument(std::format(
                "compose_sampled_data: index {} out of range [0,{})", i, n_rec));
        }
        if (i < prev) {
            throw std::invalid_argument("compose_sampled_data: sampled indices must be sorted");
        }
        prev = i;

        const auto ii = static_cast<std::size_t>(i);
        const i64 begin = data.secs[ii];
        const i64 end = data.secs[ii + 1];
        if (begin < 0 || end < begin || end > n_rows) {
            throw std::invalid_argument(std::format(
                "compose_sampled_data: record {} spans rows [{},{}) outside [0,{})",
                i, begin, end, n_rows));
        }
        const i64 len = end - begin;
        if (len > data.max_len) {
            throw std::invalid_argument(std::format(
                "compose_sampled_data: record {} has {} rows, max_len is {}", i, len, data.max_len));
        }
        out.secs[k + 1] = out.secs[k] + len;
        out.max_len = std::max(out.max_len, len);
    }
    out.total_len = out.secs[n];

    const i64 g = padding_granularity;
    const i64 padded = ((out.total_len + g - 1) / g) * g;

    out.sigma_p = ConfigMatrix::Zero(static_cast<Eigen::Index>(padded), data.n_sites());
    out.mels = Eigen::VectorXcd::Zero(static_cast<Eigen::Index>(padded));

#pragma omp parallel for schedule(static) if(n > 256)
    for (std::ptrdiff_t k = 0; k < static_cast<std::ptrdiff_t>(n); ++k) {
        const auto kk = static_cast<std::size_t>(k);
        const auto src = static_cast<Eigen::Index>(data.secs[static_cast<std::size_t>(sampled_indices[kk])]);
        const auto dst = static_cast<Eigen::Index>(out.secs[kk]);
        const auto len = static_cast<Eigen::Index>(out.secs[kk + 1] - out.secs[kk]);
        out.sigma_p.middleRows(dst, len) = data.sigma_p.middleRows(src, len);
        out.mels.segment(dst, len) = data.mels.segment(src, len);
    }

    return out;
}

} // namespace qsr
