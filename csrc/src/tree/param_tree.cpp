// Copyright 2025 The QSR Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file param_tree.cpp
 * @brief ParamTree construction, traversal and leaf-wise algebra.
 */

#include <qsr/tree/param_tree.hpp>
#include <qsr/utils/errors.hpp>

#include <cmath>
#include <format>
#include <functional>
#include <numeric>
#include <stdexcept>
#include <unordered_set>

namespace qsr {

namespace {

void map2_into(const ParamTree& a, const ParamTree& b, const LeafFn2& fn,
               ParamTree& out, const std::string& path) {
    if (a.name() != b.name() || a.is_leaf() != b.is_leaf()) {
        throw std::invalid_argument(
            std::format("tree_map2: structure mismatch at '{}'", path));
    }
    if (a.is_leaf()) {
        const auto& la = a.as_leaf();
        const auto& lb = b.as_leaf();
        if (la.values.size() != lb.values.size()) {
            throw std::invalid_argument(std::format(
                "tree_map2: leaf '{}' has {} vs {} values", path, la.values.size(), lb.values.size()));
        }
        out.as_leaf().values = fn(la, lb);
        return;
    }
    if (a.children().size() != b.children().size()) {
        throw std::invalid_argument(
            std::format("tree_map2: child count mismatch at '{}'", path));
    }
    for (std::size_t k = 0; k < a.children().size(); ++k) {
        const auto& ca = a.children()[k];
        map2_into(ca, b.children()[k], fn, out.children()[k], path + "/" + ca.name());
    }
}

void for_each_leaf(const ParamTree& t, const std::function<void(const ParamLeaf&)>& fn) {
    if (t.is_leaf()) {
        fn(t.as_leaf());
        return;
    }
    for (const auto& c : t.children()) for_each_leaf(c, fn);
}

void for_each_leaf(ParamTree& t, const std::function<void(ParamLeaf&)>& fn) {
    if (t.is_leaf()) {
        fn(t.as_leaf());
        return;
    }
    for (auto& c : t.children()) for_each_leaf(c, fn);
}

} // anonymous namespace

// ============================================================================
// Construction and traversal
// ============================================================================

ParamTree ParamTree::leaf(std::string name, ParamDType dtype,
                          Eigen::VectorXcd values, std::vector<std::size_t> shape) {
    if (shape.empty()) {
        shape.push_back(static_cast<std::size_t>(values.size()));
    }
    const std::size_t n = std::accumulate(shape.begin(), shape.end(), std::size_t{1},
                                          std::multiplies<>());
    if (n != static_cast<std::size_t>(values.size())) {
        throw std::invalid_argument(std::format(
            "ParamTree::leaf: '{}' shape holds {} values, got {}", name, n, values.size()));
    }

    ParamTree t;
    t.name_ = std::move(name);
    t.leaf_ = ParamLeaf{dtype, std::move(shape), std::move(values)};
    return t;
}

ParamTree ParamTree::branch(std::string name, std::vector<ParamTree> children) {
    std::unordered_set<std::string> seen;
    for (const auto& c : children) {
        if (!seen.insert(c.name()).second) {
            throw std::invalid_argument(std::format(
                "ParamTree::branch: duplicate child '{}' under '{}'", c.name(), name));
        }
    }

    ParamTree t;
    t.name_ = std::move(name);
    t.children_ = std::move(children);
    return t;
}

const ParamLeaf& ParamTree::as_leaf() const {
    if (!leaf_) {
        throw std::logic_error(std::format("ParamTree: '{}' is not a leaf", name_));
    }
    return *leaf_;
}

ParamLeaf& ParamTree::as_leaf() {
    if (!leaf_) {
        throw std::logic_error(std::format("ParamTree: '{}' is not a leaf", name_));
    }
    return *leaf_;
}

const ParamTree* ParamTree::find(std::string_view path) const {
    if (path.empty()) return this;

    const auto sep = path.find('/');
    const auto head = path.substr(0, sep);
    const auto rest = (sep == std::string_view::npos) ? std::string_view{} : path.substr(sep + 1);

    for (const auto& c : children_) {
        if (c.name_ == head) return c.find(rest);
    }
    return nullptr;
}

std::size_t ParamTree::leaf_count() const noexcept {
    if (leaf_) return 1;
    std::size_t n = 0;
    for (const auto& c : children_) n += c.leaf_count();
    return n;
}

std::size_t ParamTree::size() const noexcept {
    if (leaf_) return static_cast<std::size_t>(leaf_->values.size());
    std::size_t n = 0;
    for (const auto& c : children_) n += c.size();
    return n;
}

bool ParamTree::same_structure(const ParamTree& other) const noexcept {
    if (name_ != other.name_ || is_leaf() != other.is_leaf()) return false;
    if (leaf_) {
        return leaf_->dtype == other.leaf_->dtype &&
               leaf_->values.size() == other.leaf_->values.size();
    }
    if (children_.size() != other.children_.size()) return false;
    for (std::size_t k = 0; k < children_.size(); ++k) {
        if (!children_[k].same_structure(other.children_[k])) return false;
    }
    return true;
}

// ============================================================================
// Leaf-wise algebra
// ============================================================================

ParamTree tree_map(const ParamTree& t, const LeafFn& fn) {
    ParamTree out = t;
    for_each_leaf(out, [&](ParamLeaf& l) { l.values = fn(l); });
    return out;
}

ParamTree tree_map2(const ParamTree& a, const ParamTree& b, const LeafFn2& fn) {
    ParamTree out = a;
    map2_into(a, b, fn, out, a.name());
    return out;
}

ParamTree zeros_like(const ParamTree& t) {
    return tree_map(t, [](const ParamLeaf& l) -> Eigen::VectorXcd {
        return Eigen::VectorXcd::Zero(l.values.size());
    });
}

ParamTree tree_conj(const ParamTree& t) {
    return tree_map(t, [](const ParamLeaf& l) -> Eigen::VectorXcd {
        return l.values.conjugate();
    });
}

c128 tree_dot(const ParamTree& a, const ParamTree& b) {
    c128 acc{0.0, 0.0};
    tree_map2(a, b, [&](const ParamLeaf& la, const ParamLeaf& lb) -> Eigen::VectorXcd {
        acc += (la.values.array() * lb.values.array()).sum();
        return la.values;
    });
    return acc;
}

f64 tree_norm(const ParamTree& t, int p) {
    if (p != 2) {
        throw NotImplementedError(
            std::format("tree_norm: p={} not implemented, only the L2 norm is supported", p));
    }
    return std::sqrt(std::real(tree_dot(tree_conj(t), t)));
}

Eigen::VectorXcd flatten(const ParamTree& t) {
    Eigen::VectorXcd flat(static_cast<Eigen::Index>(t.size()));
    Eigen::Index pos = 0;
    for_each_leaf(t, [&](const ParamLeaf& l) {
        flat.segment(pos, l.values.size()) = l.values;
        pos += l.values.size();
    });
    return flat;
}

ParamTree unflatten_like(const ParamTree& like, const Eigen::VectorXcd& flat) {
    if (static_cast<std::size_t>(flat.size()) != like.size()) {
        throw std::invalid_argument(std::format(
            "unflatten_like: {} values for a tree of size {}", flat.size(), like.size()));
    }
    ParamTree out = like;
    Eigen::Index pos = 0;
    for_each_leaf(out, [&](ParamLeaf& l) {
        l.values = flat.segment(pos, l.values.size());
        pos += l.values.size();
    });
    return out;
}

ParamTree tree_mean(const ParamTree& t, const Communicator& comm) {
    if (comm.size() == 1) return t;
    Eigen::VectorXcd flat = flatten(t);
    comm.mean_inplace(std::span<c128>(flat.data(), static_cast<std::size_t>(flat.size())));
    return unflatten_like(t, flat);
}

} // namespace qsr
