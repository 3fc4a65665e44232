#ifndef TNPLANAR_PLANAR_ORDERING_HPP
#define TNPLANAR_PLANAR_ORDERING_HPP

#include <TNPlanar/core/expr.hpp>

#include <optional>

namespace tnplanar {

/// @return true if @p a is a cyclic rotation of @p b (reversal not allowed)
bool is_cyclic_permutation(const IndexList& a, const IndexList& b);

/// @return @p order rotated left by @p n positions
IndexList rotated(const IndexList& order, std::size_t n);

/// @brief performs the planar self-contractions of a cyclic order

/// Repeatedly deletes pairs of equal indices that are cyclically adjacent,
/// i.e. traces that can be drawn without crossing other legs.
/// @return the reduced order, or nullopt if some index occurs twice in
/// the reduced order (a non-planar trace) or more than twice
std::optional<IndexList> planar_trace_reduce(const IndexList& order);

/// @return the cyclic orders of the open legs of @p node that a planar
/// drawing of @p node can produce; empty if there is none or @p node is
/// not a tensor expression
/// @note general tensors have one order, `left ++ reverse(right)` reduced
/// by its planar traces; scalars have the empty order
container::vector<IndexList> possible_planar_orders(const NodePtr& node);

/// a way of joining two planar vertices along a block of shared legs
struct PlanarComplement {
  /// open legs of the first operand, starting right after the shared block
  IndexList oind1;
  /// open legs of the second operand, starting right after the shared block
  IndexList oind2;
  /// the shared block as it appears in the first operand
  IndexList cind1;
  /// the shared block as it appears in the second operand
  IndexList cind2;

  friend bool operator==(const PlanarComplement&,
                         const PlanarComplement&) = default;
};

/// @brief the ways of contracting the vertices with cyclic leg orders
/// @p ind1 and @p ind2 without crossings

/// If either order is empty there is one trivial way; if they share no
/// index, every pair of rotations is a way. Otherwise the shared indices
/// must form one contiguous block in both orders, traversed in opposite
/// directions; the result then is unique, and `oind1 ++ oind2` is the
/// cyclic order of the result.
container::vector<PlanarComplement> possible_planar_complements(
    const IndexList& ind1, const IndexList& ind2);

}  // namespace tnplanar

#endif  // TNPLANAR_PLANAR_ORDERING_HPP
