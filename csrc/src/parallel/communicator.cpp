// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

#include <qsr/parallel/communicator.hpp>

namespace qsr {

std::shared_ptr<const Communicator> serial_communicator() {
    static const auto comm = std::make_shared<const SerialCommunicator>();
    return comm;
}

c128 comm_mean(c128 value, const Communicator& comm) {
    comm.mean_inplace(std::span<c128>(&value, 1));
    return value;
}

} // namespace qsr
