#ifndef TNPLANAR_PLANAR_DECOMPOSE_HPP
#define TNPLANAR_PLANAR_DECOMPOSE_HPP

#include <TNPlanar/core/expr.hpp>

namespace tnplanar {

/// @brief the leg order a lowered expression must produce
struct ContractionTarget {
  IndexList left;
  IndexList right;
  /// if true the order is only a suggestion and the result is stored in a
  /// temporary; otherwise it is the declared order of a left-hand side
  bool suggested = false;

  /// @return `left ++ reverse(right)`
  IndexList natural_order() const { return concat(left, reversed(right)); }
};

/// @brief lowers @p rhs into binary contractions that produce @p target

/// Scalars are returned as-is; general tensors too, unless they have trace
/// legs and @p target is a suggestion, in which case the trace is
/// materialized in a temporary. For a product the first planar split whose
/// open legs are a rotation of @p target is used; both operands are lowered
/// recursively and the contraction is emitted as a definition of a new
/// temporary unless the raw product already produces the declared order.
/// Summands are lowered independently against @p target.
/// @param[in,out] pre receives the definitions of the temporaries, in
/// order of evaluation
/// @param[in,out] table receives the temporaries
/// @return the lowered form of @p rhs
/// @throw PlanarityError if a product has no split matching @p target
/// @throw UnrecognizedExpressionError if @p rhs is not a scalar, general
/// tensor, product or sum
NodePtr extract_contraction_pairs(const NodePtr& rhs,
                                  const ContractionTarget& target,
                                  container::vector<NodePtr>& pre,
                                  ObjectTable& table);

/// @brief lowers every assignment with a tensor right-hand side, and every
/// bare tensor expression, of @p node

/// Each lowered statement is preceded by the definitions of its
/// temporaries. Annotated blocks are left alone.
/// @sa extract_contraction_pairs
NodePtr decompose_contractions(const NodePtr& node, ObjectTable& table);

}  // namespace tnplanar

#endif  // TNPLANAR_PLANAR_DECOMPOSE_HPP
