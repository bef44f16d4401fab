// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file errors.hpp
 * @brief Exception types beyond the standard hierarchy.
 *
 * Validation failures use std::invalid_argument directly. TypeError marks
 * malformed basis descriptors (wrong length, unknown label) and maps to a
 * Python TypeError in the bridge; NotImplementedError marks unsupported
 * options such as non-L2 tree norms.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace qsr {

class TypeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class NotImplementedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace qsr
