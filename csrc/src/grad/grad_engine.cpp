// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file grad_engine.cpp
 * @brief Reverse-mode gradient estimators for QSR training.
 */

#include <qsr/grad/grad_engine.hpp>
#include <qsr/grad/segment_ops.hpp>

#include <format>
#include <stdexcept>

namespace qsr {

ParamTree identity_preconditioner(const VariationalState&, const ParamTree& grad) {
    return grad;
}

ParamTree avg_log_grad(
    const VariationalState& state,
    const ConfigMatrix& samples,
    const Communicator& comm
) {
    const Eigen::Index n = samples.rows();
    if (n == 0) {
        throw std::invalid_argument("avg_log_grad: empty sample block");
    }

    const Eigen::VectorXcd cot = Eigen::VectorXcd::Constant(n, c128{1.0 / static_cast<f64>(n), 0.0});
    return tree_mean(state.log_value_vjp(state.parameters(), samples, cot), comm);
}

PositivePhase grad_local_value_rotated(
    const VariationalState& state,
    const Batch& batch,
    const Communicator& comm
) {
    const std::size_t n_seg = batch.n_segments();
    if (n_seg == 0) {
        throw std::invalid_argument("grad_local_value_rotated: batch has no segments");
    }

    const ParamTree& params = state.parameters();
    const Eigen::VectorXcd log_psi = state.log_value(params, batch.sigma_p);
    if (log_psi.size() != batch.mels.size()) {
        throw std::invalid_argument(std::format(
            "grad_local_value_rotated: ansatz returned {} values for {} configurations",
            log_psi.size(), batch.mels.size()));
    }

    const Eigen::VectorXcd log_val = segment_logsumexp(log_psi, batch.mels, batch.secs);
    const c128 log_val_mean = comm_mean(log_val.mean(), comm);

    const Eigen::VectorXcd cot_seg = Eigen::VectorXcd::Constant(
        static_cast<Eigen::Index>(n_seg), c128{1.0 / static_cast<f64>(n_seg), 0.0});
    const Eigen::VectorXcd cot_rows = segment_logsumexp_vjp(log_psi, batch.mels, batch.secs, cot_seg);

    ParamTree grad = state.log_value_vjp(params, batch.sigma_p, cot_rows);
    return {log_val_mean, tree_mean(grad, comm)};
}

ParamTree compose_grads(const ParamTree& grad_neg, const ParamTree& grad_pos) {
    return tree_map2(grad_neg, grad_pos,
        [](const ParamLeaf& n, const ParamLeaf& p) -> Eigen::VectorXcd {
            return 2.0 * (n.values - p.values).conjugate();
        });
}

ParamTree project_real(const ParamTree& update, const ParamTree& params) {
    return tree_map2(update, params,
        [](const ParamLeaf& u, const ParamLeaf& target) -> Eigen::VectorXcd {
            if (target.dtype == ParamDType::Complex) return u.values;
            return u.values.real().cast<c128>();
        });
}

} // namespace qsr
