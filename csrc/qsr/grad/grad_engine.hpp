// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file grad_engine.hpp
 * @brief Negative/positive phase gradients of the QSR cross-entropy loss.
 *
 * With O_k(x) = ∂ log ψ_θ(x) / ∂θ_k:
 *   negative phase:  G⁻ = ⟨O_k⟩_{x ~ |ψ|²}                (model samples)
 *   positive phase:  G⁺ = mean_s ∂ L_s / ∂θ_k            (rotated data)
 *     L_s = log Σ_{σ'} ⟨σ_s|U_s|σ'⟩ ψ_θ(σ')
 *   loss gradient:   g = 2 · conj(G⁻ − G⁺)
 * All estimates are averaged across workers.
 */

#pragma once

#include <qsr/data/batch.hpp>
#include <qsr/parallel/communicator.hpp>
#include <qsr/tree/param_tree.hpp>
#include <qsr/vqs/variational_state.hpp>

namespace qsr {

/** Positive-phase result. */
struct PositivePhase {
    c128 log_val_mean;  // mean_s L_s across workers
    ParamTree grad;     // G⁺
};

/**
 * Negative phase: (1/N_s) Σ_i O(x_i) over the given samples, mean-reduced.
 * @throws std::invalid_argument on an empty sample block
 */
[[nodiscard]] ParamTree avg_log_grad(
    const VariationalState& state,
    const ConfigMatrix& samples,
    const Communicator& comm
);

/**
 * Positive phase over a composed batch.
 * @throws std::invalid_argument on an empty batch
 */
[[nodiscard]] PositivePhase grad_local_value_rotated(
    const VariationalState& state,
    const Batch& batch,
    const Communicator& comm
);

/**
 * Loss gradient 2 · conj(neg − pos), leaf-wise.
 * @throws std::invalid_argument on structure mismatch
 */
[[nodiscard]] ParamTree compose_grads(const ParamTree& grad_neg, const ParamTree& grad_pos);

/**
 * Drop the imaginary part of every update leaf whose parameter is Real.
 * @throws std::invalid_argument on structure mismatch
 */
[[nodiscard]] ParamTree project_real(const ParamTree& update, const ParamTree& params);

} // namespace qsr
