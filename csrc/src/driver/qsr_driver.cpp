// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file qsr_driver.cpp
 * @brief Training step pipeline: sample → compose → phases → update.
 */

#include <qsr/driver/qsr_driver.hpp>
#include <qsr/grad/grad_engine.hpp>
#include <qsr/grad/segment_ops.hpp>
#include <qsr/hilbert/spin_space.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace qsr {

namespace {

RotationList compile_bases(const MeasurementBases& bases) {
    return std::visit([](const auto& b) -> RotationList {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            return check_bases(std::span<const std::string>(b));
        } else {
            return check_bases(b);
        }
    }, bases);
}

// log Σ_x |ψ(x)|² by streaming over the full space in chunks
f64 exact_log_norm(const VariationalState& state, const SpinSpace& space) {
    f64 mu = -std::numeric_limits<f64>::infinity();
    f64 acc = 0.0;

    for (u64 begin = 0; begin < space.n_states(); begin += ENUM_CHUNK_SIZE) {
        const ConfigMatrix chunk = space.states(begin, ENUM_CHUNK_SIZE);
        const Eigen::VectorXd log_p = 2.0 * state.log_value(state.parameters(), chunk).real();

        const f64 chunk_max = log_p.maxCoeff();
        if (chunk_max > mu) {
            acc *= std::exp(mu - chunk_max);
            mu = chunk_max;
        }
        acc += (log_p.array() - mu).exp().sum();
    }
    return std::log(acc) + mu;
}

} // anonymous namespace

QSR::QSR(TrainingData data,
         VariationalState& state,
         const DriverConfig& config,
         Preconditioner preconditioner,
         std::shared_ptr<const Communicator> comm)
    : state_(state),
      config_(config),
      preconditioner_(std::move(preconditioner)),
      comm_(std::move(comm)) {
    if (!comm_) {
        throw std::invalid_argument("QSR: communicator is null");
    }
    if (!preconditioner_) {
        throw std::invalid_argument("QSR: preconditioner is empty");
    }
    if (config_.training_batch_size <= 0) {
        throw std::invalid_argument(std::format(
            "QSR: training_batch_size={} must be positive", config_.training_batch_size));
    }
    if (data.samples.rows() == 0) {
        throw std::invalid_argument("QSR: training data has no samples");
    }
    if (data.samples.cols() != state_.n_sites()) {
        throw std::invalid_argument(std::format(
            "QSR: samples have {} sites, variational state has {}",
            data.samples.cols(), state_.n_sites()));
    }

    rng_ = make_worker_rng(config_.seed, *comm_);

    samples_ = std::move(data.samples);
    rotations_ = compile_bases(data.bases);
    data_ = convert_data(samples_, rotations_);

    // Global logger level changes only once the driver is fully built
    spdlog::set_level(config_.log_level);
    spdlog::info("QSR: {} records on {} sites, batch size {}, worker {}/{}",
                 data_.n_records(), data_.n_sites(), config_.training_batch_size,
                 comm_->rank(), comm_->size());
}

ParamTree QSR::step() {
    state_.reset();
    grad_neg_ = avg_log_grad(state_, state_.samples(), *comm_);

    sampled_indices_ = sample_indices(rng_, static_cast<i64>(data_.n_records()),
                                      config_.training_batch_size);
    batch_ = compose_sampled_data(data_, sampled_indices_, config_.padding_granularity);

    auto pos = grad_local_value_rotated(state_, *batch_, *comm_);
    grad_pos_ = std::move(pos.grad);
    info_.log_val_rot = pos.log_val_mean;

    loss_grad_ = compose_grads(grad_neg_, grad_pos_);

    ParamTree dp = preconditioner_(state_, loss_grad_);
    if (!dp.same_structure(loss_grad_)) {
        throw std::invalid_argument("QSR::step: preconditioner changed the parameter tree structure");
    }
    dp_ = project_real(dp, state_.parameters());

    info_.loss_grad_norm = tree_norm(loss_grad_);
    info_.dp_norm = tree_norm(dp_);
    ++step_count_;

    spdlog::debug("QSR step {}: batch rows {}/{} (max_len={}), loss_grad_norm={:.6e}, dp_norm={:.6e}",
                  step_count_, batch_->total_len, batch_->mels.size(), batch_->max_len,
                  info_.loss_grad_norm, info_.dp_norm);
    return dp_;
}

f64 QSR::nll() {
    if (!batch_) {
        throw std::logic_error("QSR::nll: no training batch yet, call step() first");
    }
    const int n_sites = state_.n_sites();
    if (n_sites > config_.nll_max_sites) {
        throw std::length_error(std::format(
            "QSR::nll: exact normalization over 2^{} states exceeds nll_max_sites={}",
            n_sites, config_.nll_max_sites));
    }

    const Eigen::VectorXcd log_psi = state_.log_value(state_.parameters(), batch_->sigma_p);
    const Eigen::VectorXd log_val_rot = segment_log_prob(log_psi, batch_->mels, batch_->secs);
    const f64 ce = comm_mean(c128{log_val_rot.mean(), 0.0}, *comm_).real();

    const f64 log_n = exact_log_norm(state_, SpinSpace(n_sites));
    return log_n - ce;
}

void QSR::log_additional_data(std::map<std::string, f64>& log_dict) const {
    log_dict["loss_grad_norm"] = info_.loss_grad_norm;
    log_dict["dp_norm"] = info_.dp_norm;
}

std::string QSR::to_string() const {
    return std::format("QSR(step_count = {}, n_records = {}, n_sites = {}, training_batch_size = {})",
                       step_count_, data_.n_records(), data_.n_sites(), config_.training_batch_size);
}

} // namespace qsr
