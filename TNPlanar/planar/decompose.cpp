#include <TNPlanar/planar/decompose.hpp>

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>
#include <TNPlanar/core/logger.hpp>
#include <TNPlanar/core/utility/exception.hpp>
#include <TNPlanar/planar/ordering.hpp>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find.hpp>

#include <optional>
#include <utility>

namespace tnplanar {

namespace {

/// @return true if every index of @p a occurs in @p b
bool is_subset(const IndexList& a, const IndexList& b) {
  return ranges::all_of(a, [&b](const Index& i) {
    return ranges::find(b, i) != b.end();
  });
}

/// @return a reference to a new temporary `tmp[left;right]`, defined as
/// @p rhs by a statement appended to @p pre
NodePtr materialize(const NodePtr& rhs, IndexList left, IndexList right,
                    container::vector<NodePtr>& pre, ObjectTable& table) {
  auto lhs = tensor(table.make_temporary(), std::move(left), std::move(right));
  pre.push_back(define(lhs, rhs));
  auto& l = Logger::instance();
  if (l.decompose)
    write_log(l, "extract_contraction_pairs: ", deparse(pre.back(), &table),
              "\n");
  return lhs;
}

NodePtr extract_product(const NodePtr& rhs, const ContractionTarget& target,
                        container::vector<NodePtr>& pre, ObjectTable& table) {
  const auto& p = rhs->as<Product>();
  const auto lhs_ind = target.natural_order();

  // the first planar split matching the target
  std::optional<PlanarComplement> match;
  const auto orders2 = possible_planar_orders(p.right);
  for (const auto& ind1 : possible_planar_orders(p.left)) {
    for (const auto& ind2 : orders2) {
      for (auto& c : possible_planar_complements(ind1, ind2)) {
        if (is_cyclic_permutation(concat(c.oind1, c.oind2), lhs_ind)) {
          match = std::move(c);
          break;
        }
      }
      if (match) break;
    }
    if (match) break;
  }
  if (!match)
    throw PlanarityError("not a planar diagram expression",
                         deparse(rhs, &table));
  auto [oind1, oind2, cind1, cind2] = std::move(*match);

  NodePtr a1, a2;
  if (is_subset(oind2, target.left) && is_subset(oind1, target.right)) {
    a1 = extract_contraction_pairs(p.right, {oind2, reversed(cind2), true},
                                   pre, table);
    a2 = extract_contraction_pairs(p.left, {cind1, reversed(oind1), true}, pre,
                                   table);
    std::swap(oind1, oind2);
    std::swap(cind1, cind2);
  } else {
    a1 = extract_contraction_pairs(p.left, {oind1, reversed(cind1), true}, pre,
                                   table);
    a2 = extract_contraction_pairs(p.right, {cind2, reversed(oind2), true},
                                   pre, table);
  }

  if (is_scalar(*a1) || is_scalar(*a2)) {
    if (!target.suggested) return a1 * a2;
    return materialize(a1 * a2, oind1, reversed(oind2), pre, table);
  }

  // the suggested orders need not have been honored; use the actual ones
  const auto t1 = decompose_general_tensor(a1).term;
  const auto t2 = decompose_general_tensor(a2).term;
  if (is_subset(oind1, t1.right) && is_subset(oind2, t2.left)) {
    std::swap(a1, a2);
    std::swap(oind1, oind2);
  }

  // a raw product whose natural order is the declared one needs no
  // temporary
  if (!target.suggested) {
    if (lhs_ind == concat(oind1, oind2)) return a1 * a2;
    if (lhs_ind == concat(oind2, oind1)) return a2 * a1;
  }
  return materialize(a1 * a2, oind1, reversed(oind2), pre, table);
}

}  // namespace

NodePtr extract_contraction_pairs(const NodePtr& rhs,
                                  const ContractionTarget& target,
                                  container::vector<NodePtr>& pre,
                                  ObjectTable& table) {
  if (is_scalar(*rhs)) return rhs;

  if (is_general_tensor(*rhs)) {
    if (target.suggested &&
        has_trace_indices(decompose_general_tensor(rhs).term))
      return materialize(rhs, target.left, target.right, pre, table);
    return rhs;
  }

  if (rhs->is<Product>()) return extract_product(rhs, target, pre, table);

  if (rhs->is<Sum>()) {
    Sum result;
    for (const auto& s : rhs->as<Sum>().summands)
      result.summands.push_back(
          {s.sign, extract_contraction_pairs(s.term, target, pre, table)});
    auto sum = ex<Sum>(std::move(result));
    // an operand of a binary contraction must be a single tensor
    if (target.suggested)
      return materialize(sum, target.left, target.right, pre, table);
    return sum;
  }

  throw UnrecognizedExpressionError("unknown tensor expression",
                                    deparse(rhs, &table));
}

namespace {

NodePtr with_pre(container::vector<NodePtr> pre, NodePtr statement) {
  if (pre.empty()) return statement;
  pre.push_back(std::move(statement));
  return block(std::move(pre));
}

}  // namespace

NodePtr decompose_contractions(const NodePtr& node, ObjectTable& table) {
  if (node->is<AnnotatedBlock>()) return node;

  if (node->is<Assignment>()) {
    const auto& a = node->as<Assignment>();
    if (!is_tensor_expr(*a.rhs)) return node;
    ContractionTarget target;
    if (a.lhs->is<TensorTerm>()) {
      target.left = a.lhs->as<TensorTerm>().left;
      target.right = a.lhs->as<TensorTerm>().right;
    }
    container::vector<NodePtr> pre;
    auto rhs = extract_contraction_pairs(a.rhs, target, pre, table);
    return with_pre(std::move(pre),
                    ex<Assignment>(a.lhs, std::move(rhs), a.definition));
  }

  if (is_tensor_expr(*node)) {
    container::vector<NodePtr> pre;
    auto result = extract_contraction_pairs(
        node, ContractionTarget{.suggested = true}, pre, table);
    return with_pre(std::move(pre), std::move(result));
  }

  return map_children(node, [&table](const NodePtr& child) {
    return decompose_contractions(child, table);
  });
}

}  // namespace tnplanar
