// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file communicator.hpp
 * @brief Collective mean-reduction over a fixed group of workers.
 *
 * Every worker holds the same dataset and parameters and samples
 * independently; gradients and scalar estimates are combined with a
 * blocking, order-independent mean. The transport is left to the
 * implementation; a single-process build uses SerialCommunicator.
 */

#pragma once

#include <qsr/utils/types.hpp>

#include <memory>
#include <span>

namespace qsr {

class Communicator {
public:
    virtual ~Communicator() = default;

    /// Index of this worker in [0, size()).
    [[nodiscard]] virtual int rank() const noexcept = 0;

    /// Number of workers in the group.
    [[nodiscard]] virtual int size() const noexcept = 0;

    /// Replace each element by its mean over all workers (blocking).
    virtual void mean_inplace(std::span<c128> values) const = 0;
};

/** Single-worker group: the mean is the identity. */
class SerialCommunicator final : public Communicator {
public:
    [[nodiscard]] int rank() const noexcept override { return 0; }
    [[nodiscard]] int size() const noexcept override { return 1; }
    void mean_inplace(std::span<c128>) const override {}
};

[[nodiscard]] std::shared_ptr<const Communicator> serial_communicator();

/// Mean of a scalar over all workers.
[[nodiscard]] c128 comm_mean(c128 value, const Communicator& comm);

} // namespace qsr
