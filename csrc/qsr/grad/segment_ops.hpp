// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file segment_ops.hpp
 * @brief Segment reductions over offset-indexed flat arrays.
 *
 * Offsets `secs` (length S+1, non-decreasing) delimit S segments
 * [secs[s], secs[s+1]). Entries past secs[S] (padding) belong to no
 * segment and never contribute.
 *
 * Rotated log-amplitude of segment s:
 *   L_s = log Σ_{j∈s} m_j · exp(ℓ_j)
 * evaluated with the shift μ_s = max_j Re ℓ_j:
 *   L_s = μ_s + log Σ_j m_j · exp(ℓ_j − μ_s)
 * The shift is exact in real arithmetic; for a single entry with m = 1 it
 * returns ℓ_j bit-for-bit.
 */

#pragma once

#include <qsr/utils/types.hpp>

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <complex>
#include <format>
#include <limits>
#include <span>
#include <stdexcept>
#include <vector>

namespace qsr {

/**
 * Validate offsets against a flat array of length n.
 * @throws std::invalid_argument if secs is empty, decreasing, starts below
 *         zero or ends past n
 */
void check_sections(std::span<const i64> secs, std::size_t n);

/**
 * out[s] = Σ_{j ∈ [secs[s], secs[s+1])} arr[j]; empty segments give T{}.
 */
template<typename T>
[[nodiscard]] std::vector<T> sum_sections(std::span<const T> arr, std::span<const i64> secs) {
    check_sections(secs, arr.size());
    const std::size_t n_seg = secs.size() - 1;
    std::vector<T> out(n_seg, T{});

#pragma omp parallel for schedule(static) if(n_seg > 1024)
    for (std::ptrdiff_t s = 0; s < static_cast<std::ptrdiff_t>(n_seg); ++s) {
        const auto ss = static_cast<std::size_t>(s);
        T acc{};
        for (i64 j = secs[ss]; j < secs[ss + 1]; ++j) acc += arr[static_cast<std::size_t>(j)];
        out[ss] = acc;
    }
    return out;
}

// ============================================================================
// Raw kernels, shared by the Eigen entry points and the XLA FFI handlers.
// Callers validate sizes and offsets; the kernels assume them valid.
// ============================================================================

namespace kernels {

template<typename R>
struct ShiftedSum {
    R shift;              // μ_s = max Re ℓ_j
    std::complex<R> sum;  // Σ m_j exp(ℓ_j − μ_s)
};

// Empty segments report shift = -inf, sum = 0
template<typename R>
[[nodiscard]] inline ShiftedSum<R> shifted_sum(const std::complex<R>* log_psi,
                                               const std::complex<R>* mels,
                                               i64 begin, i64 end) noexcept {
    R mu = -std::numeric_limits<R>::infinity();
    for (i64 j = begin; j < end; ++j) mu = std::max(mu, log_psi[j].real());
    std::complex<R> acc{0, 0};
    for (i64 j = begin; j < end; ++j) acc += mels[j] * std::exp(log_psi[j] - mu);
    return {mu, acc};
}

// out[s] = L_s for s < n_seg
template<typename R>
void segment_lse_forward(const std::complex<R>* log_psi,
                         const std::complex<R>* mels,
                         const i64* secs, i64 n_seg,
                         std::complex<R>* out) noexcept {
#pragma omp parallel for schedule(static) if(n_seg > 1024)
    for (i64 s = 0; s < n_seg; ++s) {
        if (secs[s] == secs[s + 1]) {
            out[s] = std::complex<R>(-std::numeric_limits<R>::infinity(), 0);
            continue;
        }
        const auto sh = shifted_sum<R>(log_psi, mels, secs[s], secs[s + 1]);
        out[s] = std::log(sh.sum) + sh.shift;
    }
}

// grad[j] = cot_s · m_j exp(ℓ_j) / Σ_s inside segment s, 0 on the n entries elsewhere
template<typename R>
void segment_lse_backward(const std::complex<R>* log_psi,
                          const std::complex<R>* mels,
                          const i64* secs, i64 n_seg,
                          const std::complex<R>* cot,
                          i64 n, std::complex<R>* grad) noexcept {
    std::fill(grad, grad + n, std::complex<R>(0, 0));

#pragma omp parallel for schedule(static) if(n_seg > 1024)
    for (i64 s = 0; s < n_seg; ++s) {
        const i64 b = secs[s];
        const i64 e = secs[s + 1];
        if (b == e) continue;
        const auto sh = shifted_sum<R>(log_psi, mels, b, e);
        const std::complex<R> scale = cot[s] / sh.sum;
        for (i64 j = b; j < e; ++j) grad[j] = scale * mels[j] * std::exp(log_psi[j] - sh.shift);
    }
}

} // namespace kernels

/**
 * Forward: L_s = log Σ_{j∈s} mels_j · exp(log_psi_j).
 * Empty segments give -inf.
 * @throws std::invalid_argument on size mismatch or invalid offsets
 */
[[nodiscard]] Eigen::VectorXcd segment_logsumexp(
    const Eigen::VectorXcd& log_psi,
    const Eigen::VectorXcd& mels,
    std::span<const i64> secs
);

/**
 * Backward: ∂(Σ_s cot_s L_s)/∂log_psi_j = cot_s · mels_j exp(log_psi_j) / Σ_s
 * for j in segment s, 0 outside every segment.
 * @throws std::invalid_argument on size mismatch or invalid offsets
 */
[[nodiscard]] Eigen::VectorXcd segment_logsumexp_vjp(
    const Eigen::VectorXcd& log_psi,
    const Eigen::VectorXcd& mels,
    std::span<const i64> secs,
    const Eigen::VectorXcd& cot
);

/**
 * log |Σ_{j∈s} mels_j · exp(log_psi_j)|² = 2 Re L_s.
 */
[[nodiscard]] Eigen::VectorXd segment_log_prob(
    const Eigen::VectorXcd& log_psi,
    const Eigen::VectorXcd& mels,
    std::span<const i64> secs
);

} // namespace qsr
