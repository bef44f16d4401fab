// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file segment_ops.cpp
 * @brief Stabilized segment log-sum-exp (forward + VJP).
 */

#include <qsr/grad/segment_ops.hpp>

namespace qsr {

namespace {

inline void check_sizes(const Eigen::VectorXcd& log_psi, const Eigen::VectorXcd& mels,
                        std::span<const i64> secs, const char* who) {
    if (log_psi.size() != mels.size()) {
        throw std::invalid_argument(std::format(
            "{}: log_psi has {} entries, mels has {}", who, log_psi.size(), mels.size()));
    }
    check_sections(secs, static_cast<std::size_t>(mels.size()));
}

} // anonymous namespace

void check_sections(std::span<const i64> secs, std::size_t n) {
    if (secs.empty()) {
        throw std::invalid_argument("check_sections: offsets must have at least one entry");
    }
    if (secs.front() < 0) {
        throw std::invalid_argument(
            std::format("check_sections: first offset {} is negative", secs.front()));
    }
    for (std::size_t s = 1; s < secs.size(); ++s) {
        if (secs[s] < secs[s - 1]) {
            throw std::invalid_argument(
                std::format("check_sections: offsets decrease at {}", s));
        }
    }
    if (static_cast<std::size_t>(secs.back()) > n) {
        throw std::invalid_argument(std::format(
            "check_sections: last offset {} exceeds array length {}", secs.back(), n));
    }
}

Eigen::VectorXcd segment_logsumexp(
    const Eigen::VectorXcd& log_psi,
    const Eigen::VectorXcd& mels,
    std::span<const i64> secs
) {
    check_sizes(log_psi, mels, secs, "segment_logsumexp");
    const std::size_t n_seg = secs.size() - 1;
    Eigen::VectorXcd out(static_cast<Eigen::Index>(n_seg));
    kernels::segment_lse_forward<f64>(log_psi.data(), mels.data(), secs.data(),
                                      static_cast<i64>(n_seg), out.data());
    return out;
}

Eigen::VectorXcd segment_logsumexp_vjp(
    const Eigen::VectorXcd& log_psi,
    const Eigen::VectorXcd& mels,
    std::span<const i64> secs,
    const Eigen::VectorXcd& cot
) {
    check_sizes(log_psi, mels, secs, "segment_logsumexp_vjp");
    const std::size_t n_seg = secs.size() - 1;
    if (static_cast<std::size_t>(cot.size()) != n_seg) {
        throw std::invalid_argument(std::format(
            "segment_logsumexp_vjp: {} cotangents for {} segments", cot.size(), n_seg));
    }

    Eigen::VectorXcd grad(log_psi.size());
    kernels::segment_lse_backward<f64>(log_psi.data(), mels.data(), secs.data(),
                                       static_cast<i64>(n_seg), cot.data(),
                                       static_cast<i64>(grad.size()), grad.data());
    return grad;
}

Eigen::VectorXd segment_log_prob(
    const Eigen::VectorXcd& log_psi,
    const Eigen::VectorXcd& mels,
    std::span<const i64> secs
) {
    return 2.0 * segment_logsumexp(log_psi, mels, secs).real();
}

} // namespace qsr
