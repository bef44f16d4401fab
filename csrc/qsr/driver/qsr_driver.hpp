// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file qsr_driver.hpp
 * @brief Quantum state reconstruction training step and NLL diagnostic.
 *
 * Owns the converted measurement dataset and the per-worker RNG; exposes
 * one gradient step to an external training loop which applies the
 * returned update with its optimizer. Steps are strictly sequential: the
 * parameters are mutated in place between calls.
 */

#pragma once

#include <qsr/basis/basis_builder.hpp>
#include <qsr/data/batch.hpp>
#include <qsr/data/conn_dataset.hpp>
#include <qsr/parallel/communicator.hpp>
#include <qsr/tree/param_tree.hpp>
#include <qsr/utils/constants.hpp>
#include <qsr/vqs/variational_state.hpp>

#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace qsr {

/// Per-record bases: descriptors or prebuilt operators.
using MeasurementBases = std::variant<std::vector<std::string>, RotationList>;

/** Measurement records: samples.row(i) was measured in bases[i]. */
struct TrainingData {
    ConfigMatrix samples;
    MeasurementBases bases;
};

struct DriverConfig {
    i64 training_batch_size = 0;                 // Records drawn per step
    std::optional<u64> seed;                     // Root seed; none → random_device
    i64 padding_granularity = DEFAULT_PADDING_GRANULARITY;
    int nll_max_sites = DEFAULT_NLL_MAX_SITES;   // Opt-in bound for exact normalization
    spdlog::level::level_enum log_level = spdlog::level::warn;
};

/** Diagnostics of the last step. */
struct StepInfo {
    f64 loss_grad_norm = 0.0;
    f64 dp_norm = 0.0;
    c128 log_val_rot{0.0, 0.0};
};

/**
 * @class QSR
 * @brief Quantum state reconstruction driver.
 */
class QSR {
public:
    /**
     * Convert the dataset and seed the worker RNG.
     *
     * @throws std::invalid_argument if training_batch_size <= 0, the
     *         dataset is empty, or its width differs from state.n_sites()
     * @throws TypeError on malformed basis descriptors
     */
    QSR(TrainingData data,
        VariationalState& state,
        const DriverConfig& config,
        Preconditioner preconditioner = identity_preconditioner,
        std::shared_ptr<const Communicator> comm = serial_communicator());

    /**
     * One gradient computation. Returns the parameter update
     * (preconditioned, real-projected); applying it is the caller's job.
     */
    [[nodiscard]] ParamTree step();

    /**
     * Negative log-likelihood of the last training batch.
     *
     * Evaluates the exact normalization by enumerating all 2^N
     * configurations: exponential cost, allowed only for
     * N <= DriverConfig::nll_max_sites.
     *
     * @throws std::logic_error before the first step()
     * @throws std::length_error if N exceeds nll_max_sites
     */
    [[nodiscard]] f64 nll();

    [[nodiscard]] const StepInfo& info() const noexcept { return info_; }

    /// Add loss_grad_norm / dp_norm of the last step to a log record.
    void log_additional_data(std::map<std::string, f64>& log_dict) const;

    [[nodiscard]] i64 step_count() const noexcept { return step_count_; }
    [[nodiscard]] i64 training_batch_size() const noexcept { return config_.training_batch_size; }
    [[nodiscard]] const ConnDataset& dataset() const noexcept { return data_; }
    [[nodiscard]] const ConfigMatrix& training_samples() const noexcept { return samples_; }

    /// Last composed batch and its sorted record indices (empty before step()).
    [[nodiscard]] const std::optional<Batch>& last_batch() const noexcept { return batch_; }
    [[nodiscard]] const std::vector<i64>& sampled_indices() const noexcept { return sampled_indices_; }

    [[nodiscard]] const ParamTree& loss_grad() const noexcept { return loss_grad_; }
    [[nodiscard]] const ParamTree& dp() const noexcept { return dp_; }

    [[nodiscard]] std::string to_string() const;

private:
    VariationalState& state_;
    DriverConfig config_;
    Preconditioner preconditioner_;
    std::shared_ptr<const Communicator> comm_;
    std::mt19937_64 rng_;

    ConfigMatrix samples_;
    RotationList rotations_;
    ConnDataset data_;

    i64 step_count_ = 0;
    std::vector<i64> sampled_indices_;
    std::optional<Batch> batch_;
    ParamTree grad_neg_;
    ParamTree grad_pos_;
    ParamTree loss_grad_;
    ParamTree dp_;
    StepInfo info_;
};

} // namespace qsr
