// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file variational_state.hpp
 * @brief Interface to the variational ansatz and its Monte-Carlo sampler.
 *
 * The training core never looks inside the ansatz. It needs:
 *   - log ψ_θ(x) on a block of configurations
 *   - the vector-Jacobian product  Σ_i c_i ∂ log ψ_θ(x_i) / ∂θ
 *   - a sampler that refreshes samples from |ψ_θ|² on reset()
 *
 * VJP convention: derivatives are holomorphic (∂/∂θ, not ∂/∂θ*) for
 * complex leaves; for real leaves the derivative of the complex output is
 * returned as a complex value. The result has the structure of
 * parameters().
 */

#pragma once

#include <qsr/hilbert/spin_space.hpp>
#include <qsr/tree/param_tree.hpp>

#include <Eigen/Dense>

#include <functional>

namespace qsr {

class VariationalState {
public:
    virtual ~VariationalState() = default;

    [[nodiscard]] virtual int n_sites() const = 0;

    /// Current trainable parameters (mutated externally between steps).
    [[nodiscard]] virtual const ParamTree& parameters() const = 0;

    /// Invalidate cached samples so the next samples() call draws anew.
    virtual void reset() = 0;

    /// Current Monte-Carlo samples, one configuration per row.
    [[nodiscard]] virtual const ConfigMatrix& samples() = 0;

    /// log ψ_θ(x) for each row of configs.
    [[nodiscard]] virtual Eigen::VectorXcd log_value(
        const ParamTree& params, const ConfigMatrix& configs) const = 0;

    /// Σ_i cot_i · ∂ log ψ_θ(x_i) / ∂θ, shaped like params.
    [[nodiscard]] virtual ParamTree log_value_vjp(
        const ParamTree& params, const ConfigMatrix& configs,
        const Eigen::VectorXcd& cot) const = 0;
};

/**
 * Map a loss gradient to a parameter update, e.g. a natural-gradient /
 * stochastic-reconfiguration solver. Must preserve tree structure.
 */
using Preconditioner = std::function<ParamTree(const VariationalState&, const ParamTree&)>;

/// Returns the gradient unchanged.
[[nodiscard]] ParamTree identity_preconditioner(const VariationalState& state,
                                                const ParamTree& grad);

} // namespace qsr
