// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * Tests for the spin-1/2 configuration space.
 *
 * Validates:
 *  - Index ↔ configuration encoding (site 0 most significant)
 *  - Chunked enumeration and clipping
 *  - Rejection of non-±1 entries and invalid site counts
 *
 * File: tests/cpp/test_spin_space.cpp
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_test_macros.hpp>

#include <qsr/hilbert/spin_space.hpp>
#include <qsr/utils/constants.hpp>

#include <span>
#include <stdexcept>
#include <vector>

using namespace qsr;

TEST_CASE("SpinSpace: construction bounds", "[spin]") {
    REQUIRE_THROWS_AS(SpinSpace(0), std::invalid_argument);
    REQUIRE_THROWS_AS(SpinSpace(MAX_SITES + 1), std::invalid_argument);

    SpinSpace s(3);
    REQUIRE(s.n_sites() == 3);
    REQUIRE(s.n_states() == 8);
}

TEST_CASE("SpinSpace: local index ordering", "[spin]") {
    REQUIRE(local_index(-1.0) == 0);
    REQUIRE(local_index(1.0) == 1);
    REQUIRE_THROWS_AS(local_index(0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(local_index(0.5), std::invalid_argument);
}

TEST_CASE("SpinSpace: encoding", "[spin]") {
    SpinSpace s(3);

    SECTION("Site 0 is the most significant bit") {
        std::vector<double> row(3);
        s.state_to_config(0b100, row);
        REQUIRE(row == std::vector<double>{1.0, -1.0, -1.0});

        s.state_to_config(0, row);
        REQUIRE(row == std::vector<double>{-1.0, -1.0, -1.0});
    }

    SECTION("Round trip over the whole space") {
        const ConfigMatrix all = s.all_states();
        REQUIRE(all.rows() == 8);
        for (Eigen::Index r = 0; r < all.rows(); ++r) {
            std::span<const double> row(all.row(r).data(), 3);
            REQUIRE(s.config_to_state(row) == static_cast<u64>(r));
        }
    }

    SECTION("Bad rows") {
        std::vector<double> short_row{1.0, 1.0};
        REQUIRE_THROWS_AS(s.config_to_state(short_row), std::invalid_argument);

        std::vector<double> bad{1.0, 0.0, -1.0};
        REQUIRE_THROWS_AS(s.config_to_state(bad), std::invalid_argument);
    }
}

TEST_CASE("SpinSpace: chunked enumeration", "[spin]") {
    SpinSpace s(4);
    const ConfigMatrix all = s.all_states();

    const ConfigMatrix mid = s.states(5, 4);
    REQUIRE(mid.rows() == 4);
    REQUIRE(mid == all.middleRows(5, 4));

    // Clipped at the end of the space
    const ConfigMatrix tail = s.states(14, 10);
    REQUIRE(tail.rows() == 2);
    REQUIRE(s.states(100, 3).rows() == 0);
}
