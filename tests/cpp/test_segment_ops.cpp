// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * Tests for segment reductions used by the positive phase.
 *
 * Validates:
 *  - sum_sections on real and complex arrays, empty segments
 *  - Stabilized log-sum-exp against the naive formula and at large magnitude
 *  - VJP against finite differences of the real part
 *  - Raw kernels in single precision
 *
 * File: tests/cpp/test_segment_ops.cpp
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <qsr/grad/segment_ops.hpp>

#include <cmath>
#include <complex>
#include <limits>
#include <vector>

using namespace qsr;
using Catch::Approx;

namespace {

Eigen::VectorXcd vec(std::initializer_list<c128> xs) {
    Eigen::VectorXcd v(static_cast<Eigen::Index>(xs.size()));
    Eigen::Index k = 0;
    for (const auto& x : xs) v(k++) = x;
    return v;
}

c128 naive_lse(const Eigen::VectorXcd& lp, const Eigen::VectorXcd& m, i64 b, i64 e) {
    c128 acc{0.0, 0.0};
    for (i64 j = b; j < e; ++j) acc += m(j) * std::exp(lp(j));
    return std::log(acc);
}

} // namespace

// ============================================================================
// sum_sections
// ============================================================================

TEST_CASE("sum_sections: real and complex", "[segment]") {
    const std::vector<i64> secs{0, 2, 2, 5};

    SECTION("Real") {
        const std::vector<double> arr{1.0, 2.0, 3.0, 4.0, 5.0, 100.0};
        const auto out = sum_sections<double>(arr, secs);
        REQUIRE(out == std::vector<double>{3.0, 0.0, 12.0});
    }

    SECTION("Complex") {
        const std::vector<c128> arr{{1, 1}, {0, 1}, {2, 0}, {0, -1}, {1, 0}};
        const auto out = sum_sections<c128>(arr, secs);
        REQUIRE(out.size() == 3);
        REQUIRE(out[0] == c128(1, 2));
        REQUIRE(out[1] == c128(0, 0));
        REQUIRE(out[2] == c128(3, -1));
    }

    SECTION("Bad offsets") {
        const std::vector<double> arr{1.0, 2.0};
        REQUIRE_THROWS_AS(sum_sections<double>(arr, std::vector<i64>{}), std::invalid_argument);
        REQUIRE_THROWS_AS(sum_sections<double>(arr, std::vector<i64>{0, 3}), std::invalid_argument);
        REQUIRE_THROWS_AS(sum_sections<double>(arr, std::vector<i64>{0, 2, 1}), std::invalid_argument);
    }
}

// ============================================================================
// Log-sum-exp
// ============================================================================

TEST_CASE("segment_logsumexp: matches naive sum", "[segment]") {
    const auto lp = vec({{0.1, 0.3}, {-0.4, 1.2}, {0.7, -0.5}, {0.2, 0.0}, {-1.0, 2.0}});
    const auto m  = vec({{0.7, 0.0}, {0.0, -0.7}, {0.5, 0.5}, {1.0, 0.0}, {-0.3, 0.2}});
    const std::vector<i64> secs{0, 2, 3, 5};

    const auto out = segment_logsumexp(lp, m, secs);
    REQUIRE(out.size() == 3);
    for (std::size_t s = 0; s < 3; ++s) {
        const c128 ref = naive_lse(lp, m, secs[s], secs[s + 1]);
        // Compare through exp to avoid branch ambiguity of the imaginary part
        REQUIRE(std::abs(std::exp(out(s)) - std::exp(ref)) < 1e-12);
        REQUIRE(out(s).real() == Approx(ref.real()));
    }
}

TEST_CASE("segment_logsumexp: single identity entry is exact", "[segment]") {
    const auto lp = vec({{-3.25, 0.5}});
    const auto m  = vec({{1.0, 0.0}});
    const std::vector<i64> secs{0, 1};
    const auto out = segment_logsumexp(lp, m, secs);
    REQUIRE(out(0).real() == Approx(-3.25));
    REQUIRE(std::abs(std::exp(c128(0, out(0).imag())) - std::exp(c128(0, 0.5))) < 1e-12);
}

TEST_CASE("segment_logsumexp: stable at large magnitude", "[segment]") {
    const auto lp = vec({{800.0, 0.0}, {799.0, 0.0}, {-800.0, 0.0}, {-801.0, 0.0}});
    const auto m  = vec({{0.5, 0.0}, {0.5, 0.0}, {1.0, 0.0}, {1.0, 0.0}});
    const std::vector<i64> secs{0, 2, 4};

    const auto out = segment_logsumexp(lp, m, secs);
    REQUIRE(std::isfinite(out(0).real()));
    REQUIRE(std::isfinite(out(1).real()));

    const double ref0 = 800.0 + std::log(0.5 + 0.5 * std::exp(-1.0));
    const double ref1 = -800.0 + std::log(1.0 + std::exp(-1.0));
    REQUIRE(out(0).real() == Approx(ref0));
    REQUIRE(out(1).real() == Approx(ref1));
}

TEST_CASE("segment_logsumexp: empty segment", "[segment]") {
    const auto lp = vec({{0.0, 0.0}});
    const auto m  = vec({{1.0, 0.0}});
    const std::vector<i64> secs{0, 0, 1};
    const auto out = segment_logsumexp(lp, m, secs);
    REQUIRE(out(0).real() == -std::numeric_limits<double>::infinity());
    REQUIRE(out(1).real() == Approx(0.0));
}

TEST_CASE("segment_log_prob is twice the real part", "[segment]") {
    const auto lp = vec({{0.3, 1.0}, {0.1, -0.2}});
    const auto m  = vec({{0.6, 0.0}, {0.0, 0.8}});
    const std::vector<i64> secs{0, 2};
    const auto lse = segment_logsumexp(lp, m, secs);
    const auto lpr = segment_log_prob(lp, m, secs);
    REQUIRE(lpr(0) == Approx(2.0 * lse(0).real()));
}

// ============================================================================
// VJP
// ============================================================================

TEST_CASE("segment_logsumexp_vjp: finite differences", "[segment]") {
    const auto lp = vec({{0.1, 0.3}, {-0.4, 1.2}, {0.7, -0.5}, {0.2, 0.0}, {-1.0, 2.0}, {9.0, 9.0}});
    const auto m  = vec({{0.7, 0.0}, {0.0, -0.7}, {0.5, 0.5}, {1.0, 0.0}, {-0.3, 0.2}, {0.0, 0.0}});
    const std::vector<i64> secs{0, 2, 3, 5};
    const auto cot = vec({{1.0, 0.0}, {0.5, 0.0}, {0.25, 0.0}});

    const auto grad = segment_logsumexp_vjp(lp, m, secs, cot);
    REQUIRE(grad.size() == 6);

    // Rows outside every segment get zero
    REQUIRE(grad(5) == c128(0.0, 0.0));

    // Holomorphic: ∂ out_s / ∂ ℓ_j along the real axis
    const double h = 1e-6;
    const auto base = segment_logsumexp(lp, m, secs);
    for (Eigen::Index j = 0; j < 5; ++j) {
        Eigen::VectorXcd lp_h = lp;
        lp_h(j) += h;
        const auto pert = segment_logsumexp(lp_h, m, secs);
        c128 fd{0.0, 0.0};
        for (Eigen::Index s = 0; s < 3; ++s) {
            fd += cot(s) * (std::exp(pert(s) - base(s)) - 1.0) / h;
        }
        REQUIRE(std::abs(grad(j) - fd) < 1e-5);
    }

    // Gradient of one segment sums to its cotangent
    REQUIRE(std::abs(grad.segment(0, 2).sum() - cot(0)) < 1e-12);
    REQUIRE(std::abs(grad.segment(3, 2).sum() - cot(2)) < 1e-12);
}

TEST_CASE("segment_logsumexp_vjp: shape errors", "[segment]") {
    const auto lp = vec({{0.0, 0.0}, {0.0, 0.0}});
    const auto m  = vec({{1.0, 0.0}});
    const std::vector<i64> secs{0, 1};
    REQUIRE_THROWS_AS(segment_logsumexp(lp, m, secs), std::invalid_argument);

    const auto m2 = vec({{1.0, 0.0}, {1.0, 0.0}});
    REQUIRE_THROWS_AS(segment_logsumexp_vjp(lp, m2, secs, vec({{1, 0}, {1, 0}})),
                      std::invalid_argument);
}

// ============================================================================
// Raw kernels
// ============================================================================

TEST_CASE("kernels: single precision agrees with double entry points", "[segment][kernels]") {
    const auto lp = vec({{0.1, 0.3}, {-0.4, 1.2}, {0.7, -0.5}, {0.2, 0.0}, {-1.0, 2.0}, {9.0, 9.0}});
    const auto m  = vec({{0.7, 0.0}, {0.0, -0.7}, {0.5, 0.5}, {1.0, 0.0}, {-0.3, 0.2}, {0.0, 0.0}});
    const std::vector<i64> secs{0, 2, 2, 5};
    const auto cot = vec({{1.0, 0.0}, {0.5, 0.0}, {0.25, -0.5}});

    const auto ref = segment_logsumexp(lp, m, secs);
    const auto ref_grad = segment_logsumexp_vjp(lp, m, secs, cot);

    const std::vector<std::complex<float>> lp32(lp.data(), lp.data() + lp.size());
    const std::vector<std::complex<float>> m32(m.data(), m.data() + m.size());
    const std::vector<std::complex<float>> cot32(cot.data(), cot.data() + cot.size());

    SECTION("Forward") {
        std::vector<std::complex<float>> out(3);
        kernels::segment_lse_forward<float>(lp32.data(), m32.data(), secs.data(), 3, out.data());

        REQUIRE(std::isinf(out[1].real()));
        REQUIRE(out[1].real() < 0.0f);
        for (std::size_t s : {std::size_t{0}, std::size_t{2}}) {
            const auto r = ref(static_cast<Eigen::Index>(s));
            REQUIRE(out[s].real() == Approx(r.real()).margin(1e-5));
            REQUIRE(out[s].imag() == Approx(r.imag()).margin(1e-5));
        }
    }

    SECTION("Backward overwrites every entry") {
        std::vector<std::complex<float>> grad(6, {7.0f, 7.0f});
        kernels::segment_lse_backward<float>(lp32.data(), m32.data(), secs.data(), 3,
                                             cot32.data(), 6, grad.data());

        REQUIRE(grad[5] == std::complex<float>(0.0f, 0.0f));
        for (std::size_t j = 0; j < 5; ++j) {
            const auto r = ref_grad(static_cast<Eigen::Index>(j));
            REQUIRE(std::abs(std::complex<double>(grad[j]) - r) < 1e-5);
        }
    }
}

TEST_CASE("kernels: shifted sum of an empty range", "[segment][kernels]") {
    const std::vector<c128> lp{{1.0, 0.0}};
    const std::vector<c128> m{{1.0, 0.0}};
    const auto sh = kernels::shifted_sum<double>(lp.data(), m.data(), 0, 0);
    REQUIRE(std::isinf(sh.shift));
    REQUIRE(sh.sum == c128(0.0, 0.0));

    const auto one = kernels::shifted_sum<double>(lp.data(), m.data(), 0, 1);
    REQUIRE(one.shift == 1.0);
    REQUIRE(one.sum == c128(1.0, 0.0));
}
