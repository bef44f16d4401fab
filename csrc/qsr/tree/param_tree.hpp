// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file param_tree.hpp
 * @brief Named, nested parameter/gradient trees and their algebra.
 *
 * A ParamTree node is either a leaf (flat complex values + declared dtype +
 * logical shape) or a branch of named children. Gradient and update trees
 * share the structure of the parameter tree they derive from; binary
 * operations check structure and throw on mismatch.
 *
 * Leaf values are always stored as complex<double>. A leaf declared Real
 * holds parameters with zero imaginary part, while its gradient may be
 * complex until projected (see project_real).
 */

#pragma once

#include <qsr/parallel/communicator.hpp>
#include <qsr/utils/types.hpp>

#include <Eigen/Dense>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qsr {

enum class ParamDType : u8 { Real, Complex };

struct ParamLeaf {
    ParamDType dtype = ParamDType::Real;
    std::vector<std::size_t> shape;   // Logical shape; product == values.size()
    Eigen::VectorXcd values;
};

class ParamTree {
public:
    ParamTree() = default;

    /**
     * Leaf node. An empty shape means a flat vector of values.size().
     * @throws std::invalid_argument if prod(shape) != values.size()
     */
    [[nodiscard]] static ParamTree leaf(std::string name, ParamDType dtype,
                                        Eigen::VectorXcd values,
                                        std::vector<std::size_t> shape = {});

    /**
     * Branch node.
     * @throws std::invalid_argument on duplicate child names
     */
    [[nodiscard]] static ParamTree branch(std::string name, std::vector<ParamTree> children);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] bool is_leaf() const noexcept { return leaf_.has_value(); }

    /// Leaf payload. @throws std::logic_error on a branch
    [[nodiscard]] const ParamLeaf& as_leaf() const;
    [[nodiscard]] ParamLeaf& as_leaf();

    [[nodiscard]] const std::vector<ParamTree>& children() const noexcept { return children_; }
    [[nodiscard]] std::vector<ParamTree>& children() noexcept { return children_; }

    /// Lookup by '/'-separated path relative to this node ("dense/kernel").
    [[nodiscard]] const ParamTree* find(std::string_view path) const;

    /// Number of leaves below (1 for a leaf).
    [[nodiscard]] std::size_t leaf_count() const noexcept;

    /// Total number of scalars below.
    [[nodiscard]] std::size_t size() const noexcept;

    /// Structural equality: names, nesting, dtypes and sizes.
    [[nodiscard]] bool same_structure(const ParamTree& other) const noexcept;

private:
    std::string name_;
    std::optional<ParamLeaf> leaf_;
    std::vector<ParamTree> children_;
};

using LeafFn  = std::function<Eigen::VectorXcd(const ParamLeaf&)>;
using LeafFn2 = std::function<Eigen::VectorXcd(const ParamLeaf&, const ParamLeaf&)>;

/// Apply fn to every leaf; structure, dtypes and shapes are preserved.
[[nodiscard]] ParamTree tree_map(const ParamTree& t, const LeafFn& fn);

/**
 * Apply fn leaf-wise to two trees of identical structure; the result takes
 * the structure and dtypes of `a`.
 * @throws std::invalid_argument on structure mismatch
 */
[[nodiscard]] ParamTree tree_map2(const ParamTree& a, const ParamTree& b, const LeafFn2& fn);

[[nodiscard]] ParamTree zeros_like(const ParamTree& t);
[[nodiscard]] ParamTree tree_conj(const ParamTree& t);

/// Σ_leaves Σ_k a_k · b_k (no conjugation).
[[nodiscard]] c128 tree_dot(const ParamTree& a, const ParamTree& b);

/**
 * L-p norm of the tree interpreted as a vector: √(tree_dot(conj(t), t)).
 * @throws NotImplementedError for p != 2
 */
[[nodiscard]] f64 tree_norm(const ParamTree& t, int p = 2);

/// Concatenate leaf values in depth-first order.
[[nodiscard]] Eigen::VectorXcd flatten(const ParamTree& t);

/**
 * Inverse of flatten using `like` for structure.
 * @throws std::invalid_argument if flat.size() != like.size()
 */
[[nodiscard]] ParamTree unflatten_like(const ParamTree& like, const Eigen::VectorXcd& flat);

/// Leaf-wise mean over all workers.
[[nodiscard]] ParamTree tree_mean(const ParamTree& t, const Communicator& comm);

} // namespace qsr
