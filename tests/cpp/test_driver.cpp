// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * End-to-end tests for the QSR training step.
 *
 * Test system: linear log-amplitude ansatz
 *   log ψ_θ(x) = Σ_j (a_j + b_j) x_j
 * with a real leaf `a` and a complex leaf `b`. Gradients are closed-form:
 *   ∂ log ψ / ∂a_j = ∂ log ψ / ∂b_j = x_j
 *
 * Validates:
 *  - Computational basis: update = 2 (⟨x⟩_model − ⟨x⟩_batch)
 *  - Rotated basis gradient against finite differences of the batch loss
 *  - Preconditioner application and real-leaf projection
 *  - NLL of the uniform state, call ordering and size gate
 *  - Seeded reproducibility
 *
 * File: tests/cpp/test_driver.cpp
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <qsr/driver/qsr_driver.hpp>
#include <qsr/grad/grad_engine.hpp>
#include <qsr/grad/segment_ops.hpp>
#include <qsr/hilbert/spin_space.hpp>
#include <qsr/utils/errors.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace qsr;
using Catch::Approx;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

class LinearState final : public VariationalState {
public:
    LinearState(int n_sites, ConfigMatrix model_samples)
        : n_sites_(n_sites), samples_(std::move(model_samples)) {
        params_ = ParamTree::branch("params", {
            ParamTree::leaf("a", ParamDType::Real, Eigen::VectorXcd::Zero(n_sites)),
            ParamTree::leaf("b", ParamDType::Complex, Eigen::VectorXcd::Zero(n_sites)),
        });
    }

    int n_sites() const override { return n_sites_; }
    const ParamTree& parameters() const override { return params_; }
    void reset() override { ++resets; }
    const ConfigMatrix& samples() override { return samples_; }

    Eigen::VectorXcd log_value(const ParamTree& p, const ConfigMatrix& x) const override {
        const Eigen::VectorXcd w = p.find("a")->as_leaf().values + p.find("b")->as_leaf().values;
        return x.cast<c128>() * w;
    }

    ParamTree log_value_vjp(const ParamTree& p, const ConfigMatrix& x,
                            const Eigen::VectorXcd& cot) const override {
        const Eigen::VectorXcd g = x.cast<c128>().transpose() * cot;
        return tree_map(p, [&](const ParamLeaf&) -> Eigen::VectorXcd { return g; });
    }

    void set_weights(const Eigen::VectorXcd& a, const Eigen::VectorXcd& b) {
        params_.children()[0].as_leaf().values = a;
        params_.children()[1].as_leaf().values = b;
    }

    int resets = 0;

private:
    int n_sites_;
    ConfigMatrix samples_;
    ParamTree params_;
};

ConfigMatrix all_configs(int n) {
    return SpinSpace(n).all_states();
}

Eigen::VectorXd column_mean(const ConfigMatrix& x) {
    return x.colwise().mean().transpose();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("QSR: construction validation", "[driver]") {
    LinearState state(2, all_configs(2));
    const ConfigMatrix samples = all_configs(2);
    const std::vector<std::string> bases{"ZZ", "XZ", "ZY", "XX"};

    DriverConfig cfg;
    cfg.training_batch_size = 4;
    cfg.seed = 1;

    SECTION("Valid") {
        QSR q({samples, bases}, state, cfg);
        REQUIRE(q.step_count() == 0);
        REQUIRE(q.dataset().n_records() == 4);
        REQUIRE(q.dataset().secs == std::vector<i64>{0, 1, 3, 5, 9});
        REQUIRE_FALSE(q.last_batch().has_value());
        REQUIRE(q.to_string().find("step_count = 0") != std::string::npos);
    }

    SECTION("Non-positive batch size") {
        DriverConfig bad = cfg;
        bad.training_batch_size = 0;
        REQUIRE_THROWS_AS(QSR({samples, bases}, state, bad), std::invalid_argument);
    }

    SECTION("Empty dataset") {
        REQUIRE_THROWS_AS(QSR({ConfigMatrix(0, 2), std::vector<std::string>{}}, state, cfg),
                          std::invalid_argument);
    }

    SECTION("Width differs from the state") {
        const std::vector<std::string> wide(2, "ZZZ");
        REQUIRE_THROWS_AS(QSR({all_configs(3).topRows(2), wide}, state, cfg),
                          std::invalid_argument);
    }

    SECTION("Malformed basis") {
        const std::vector<std::string> broken{"ZZ", "XZ", "ZQ", "XX"};
        REQUIRE_THROWS_AS(QSR({samples, broken}, state, cfg), TypeError);
    }
}

TEST_CASE("QSR: log level applied only after successful construction", "[driver]") {
    LinearState state(2, all_configs(2));
    const ConfigMatrix samples = all_configs(2);
    const std::vector<std::string> bases{"ZZ", "XZ", "ZY", "XX"};

    const auto saved = spdlog::get_level();
    spdlog::set_level(spdlog::level::err);

    DriverConfig cfg;
    cfg.training_batch_size = 4;
    cfg.seed = 1;
    cfg.log_level = spdlog::level::debug;

    SECTION("Rejected batch size") {
        DriverConfig bad = cfg;
        bad.training_batch_size = -1;
        REQUIRE_THROWS_AS(QSR({samples, bases}, state, bad), std::invalid_argument);
        REQUIRE(spdlog::get_level() == spdlog::level::err);
    }

    SECTION("Rejected basis") {
        const std::vector<std::string> broken{"ZZ", "XZ", "ZQ", "XX"};
        REQUIRE_THROWS_AS(QSR({samples, broken}, state, cfg), TypeError);
        REQUIRE(spdlog::get_level() == spdlog::level::err);
    }

    SECTION("Accepted") {
        QSR q({samples, bases}, state, cfg);
        REQUIRE(spdlog::get_level() == spdlog::level::debug);
    }

    spdlog::set_level(saved);
}

// ============================================================================
// Gradient step
// ============================================================================

TEST_CASE("QSR: computational basis gradient", "[driver]") {
    const int n = 3;
    // Model samples fixed: mean x = (1, 0, -1/2)
    ConfigMatrix model(2, n);
    model << 1.0,  1.0, -1.0,
             1.0, -1.0,  0.0;
    LinearState state(n, model);

    const ConfigMatrix samples = all_configs(n);
    const std::vector<std::string> bases(static_cast<std::size_t>(samples.rows()), "ZZZ");

    DriverConfig cfg;
    cfg.training_batch_size = 16;
    cfg.seed = 2024;
    QSR q({samples, bases}, state, cfg);

    const ParamTree dp = q.step();
    REQUIRE(q.step_count() == 1);
    REQUIRE(state.resets == 1);
    REQUIRE(q.sampled_indices().size() == 16);
    REQUIRE(q.last_batch().has_value());
    REQUIRE(q.last_batch()->sigma_p.rows() % DEFAULT_PADDING_GRANULARITY == 0);

    // Empirical mean over the sampled records
    ConfigMatrix picked(16, n);
    for (std::size_t k = 0; k < 16; ++k) {
        picked.row(static_cast<Eigen::Index>(k)) = samples.row(q.sampled_indices()[k]);
    }
    const Eigen::VectorXd expected = 2.0 * (column_mean(model) - column_mean(picked));

    const auto& a = dp.find("a")->as_leaf().values;
    const auto& b = dp.find("b")->as_leaf().values;
    for (int j = 0; j < n; ++j) {
        REQUIRE(a(j).real() == Approx(expected(j)).margin(1e-12));
        REQUIRE(a(j).imag() == 0.0);
        REQUIRE(b(j).real() == Approx(expected(j)).margin(1e-12));
        REQUIRE(b(j).imag() == Approx(0.0).margin(1e-12));
    }

    // Identity preconditioner: update equals the loss gradient
    REQUIRE(flatten(q.dp()) == flatten(q.loss_grad()));
    REQUIRE(q.info().loss_grad_norm == Approx(tree_norm(q.loss_grad())));
    REQUIRE(q.info().dp_norm == Approx(q.info().loss_grad_norm));

    std::map<std::string, double> log;
    q.log_additional_data(log);
    REQUIRE(log.at("loss_grad_norm") == Approx(q.info().loss_grad_norm));
    REQUIRE(log.at("dp_norm") == Approx(q.info().dp_norm));
}

TEST_CASE("QSR: rotated basis gradient matches finite differences", "[driver]") {
    const int n = 2;
    LinearState state(n, all_configs(n));

    Eigen::VectorXcd a(n), b(n);
    a << 0.3, -0.2;
    b << c128(0.1, 0.4), c128(-0.05, 0.2);
    state.set_weights(a, b);

    const ConfigMatrix samples = all_configs(n);
    const std::vector<std::string> bases{"XY", "YX", "XZ", "YY"};

    DriverConfig cfg;
    cfg.training_batch_size = 8;
    cfg.seed = 11;
    QSR q({samples, bases}, state, cfg);
    (void)q.step();

    const Batch& batch = *q.last_batch();

    // Positive-phase objective: mean_s Re L_s as a function of the real weight a_j
    auto objective = [&](const Eigen::VectorXcd& a_h) {
        LinearState probe(n, all_configs(n));
        probe.set_weights(a_h, b);
        const auto lp = probe.log_value(probe.parameters(), batch.sigma_p);
        return segment_logsumexp(lp, batch.mels, batch.secs).real().mean();
    };

    const auto pos = grad_local_value_rotated(state, batch, *serial_communicator());
    const double h = 1e-6;
    for (int j = 0; j < n; ++j) {
        Eigen::VectorXcd ap = a, am = a;
        ap(j) += h;
        am(j) -= h;
        const double fd = (objective(ap) - objective(am)) / (2.0 * h);
        REQUIRE(pos.grad.find("a")->as_leaf().values(j).real() == Approx(fd).epsilon(1e-6).margin(1e-8));
    }

    // Real leaf projected, complex leaf kept
    const auto& dp_a = q.dp().find("a")->as_leaf().values;
    const auto& dp_b = q.dp().find("b")->as_leaf().values;
    const auto& g_b = q.loss_grad().find("b")->as_leaf().values;
    for (int j = 0; j < n; ++j) {
        REQUIRE(dp_a(j).imag() == 0.0);
        REQUIRE(dp_a(j).real() == Approx(q.loss_grad().find("a")->as_leaf().values(j).real()));
        REQUIRE(dp_b(j) == g_b(j));
    }
}

TEST_CASE("QSR: preconditioner and projection", "[driver]") {
    const int n = 2;
    LinearState state(n, all_configs(n));
    const ConfigMatrix samples = all_configs(n);
    const std::vector<std::string> bases(4, "ZZ");

    DriverConfig cfg;
    cfg.training_batch_size = 4;
    cfg.seed = 5;

    const c128 rot{1.0, 1.0};
    Preconditioner pc = [rot](const VariationalState&, const ParamTree& g) {
        return tree_map(g, [rot](const ParamLeaf& l) -> Eigen::VectorXcd { return rot * l.values; });
    };
    QSR q({samples, bases}, state, cfg, pc);
    const ParamTree dp = q.step();

    const auto& g = q.loss_grad().find("a")->as_leaf().values;
    const auto& dp_a = dp.find("a")->as_leaf().values;
    const auto& dp_b = dp.find("b")->as_leaf().values;
    for (int j = 0; j < n; ++j) {
        // Loss gradient is real here; real leaf keeps Re((1+i) g) = g
        REQUIRE(dp_a(j) == c128(g(j).real(), 0.0));
        REQUIRE(std::abs(dp_b(j) - rot * g(j)) < 1e-14);
    }

    SECTION("Structure-changing preconditioner is rejected") {
        Preconditioner broken = [](const VariationalState&, const ParamTree&) {
            return ParamTree::leaf("flat", ParamDType::Real, Eigen::VectorXcd::Zero(4));
        };
        QSR bad({samples, bases}, state, cfg, broken);
        REQUIRE_THROWS_AS(bad.step(), std::invalid_argument);
    }
}

// ============================================================================
// NLL
// ============================================================================

TEST_CASE("QSR: negative log-likelihood", "[driver]") {
    DriverConfig cfg;
    cfg.training_batch_size = 8;
    cfg.seed = 3;

    SECTION("Requires a prior step") {
        LinearState state(1, all_configs(1));
        QSR q({all_configs(1), std::vector<std::string>{"Z", "X"}}, state, cfg);
        REQUIRE_THROWS_AS(q.nll(), std::logic_error);
    }

    SECTION("Uniform state in the computational basis") {
        LinearState state(1, all_configs(1));
        QSR q({all_configs(1), std::vector<std::string>{"Z", "Z"}}, state, cfg);
        (void)q.step();
        REQUIRE(q.nll() == Approx(std::log(2.0)));
    }

    SECTION("Uniform state on several sites") {
        const int n = 4;
        LinearState state(n, all_configs(n));
        const ConfigMatrix samples = all_configs(n);
        const std::vector<std::string> bases(16, "ZZZZ");
        QSR q({samples, bases}, state, cfg);
        (void)q.step();
        REQUIRE(q.nll() == Approx(n * std::log(2.0)));
    }

    SECTION("Matches the normalized distribution") {
        const int n = 3;
        LinearState state(n, all_configs(n));
        Eigen::VectorXcd a(n), b(n);
        a << 0.4, -0.3, 0.1;
        b.setZero();
        state.set_weights(a, b);

        const ConfigMatrix samples = all_configs(n);
        const std::vector<std::string> bases(8, "ZZZ");
        QSR q({samples, bases}, state, cfg);
        (void)q.step();

        // log Z = Σ_j log(2 cosh(2 a_j)) for a product state
        double log_z = 0.0;
        for (int j = 0; j < n; ++j) log_z += std::log(2.0 * std::cosh(2.0 * a(j).real()));

        double ce = 0.0;
        for (const i64 i : q.sampled_indices()) {
            ce += 2.0 * samples.row(i).dot(a.real());
        }
        ce /= static_cast<double>(q.sampled_indices().size());
        REQUIRE(q.nll() == Approx(log_z - ce));
    }

    SECTION("Exact normalization is gated by size") {
        const int n = 3;
        LinearState state(n, all_configs(n));
        DriverConfig small = cfg;
        small.nll_max_sites = 2;
        QSR q({all_configs(n), std::vector<std::string>(8, "ZZZ")}, state, small);
        (void)q.step();
        REQUIRE_THROWS_AS(q.nll(), std::length_error);
    }
}

// ============================================================================
// Reproducibility
// ============================================================================

TEST_CASE("QSR: seeded steps are reproducible", "[driver]") {
    const int n = 3;
    const ConfigMatrix samples = all_configs(n);
    const std::vector<std::string> bases{"XZZ", "ZYZ", "ZZX", "XXX", "YYY", "ZZZ", "XYZ", "IZI"};

    DriverConfig cfg;
    cfg.training_batch_size = 32;
    cfg.seed = 99;

    LinearState s1(n, all_configs(n));
    LinearState s2(n, all_configs(n));
    QSR q1({samples, bases}, s1, cfg);
    QSR q2({samples, bases}, s2, cfg);

    for (int it = 0; it < 3; ++it) {
        const auto d1 = q1.step();
        const auto d2 = q2.step();
        REQUIRE(q1.sampled_indices() == q2.sampled_indices());
        REQUIRE(flatten(d1) == flatten(d2));
    }
    REQUIRE(q1.step_count() == 3);
}
