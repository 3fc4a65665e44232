#ifndef TNPLANAR_EXPR_ALGORITHMS_HPP
#define TNPLANAR_EXPR_ALGORITHMS_HPP

#include <TNPlanar/core/expr.hpp>

#include <functional>

namespace tnplanar {

/// @return true if @p node is a scalar expression, i.e. contains no tensor
/// terms
bool is_scalar(const Node& node);

/// @return true if @p node is a tensor expression: a tensor term, or a
/// conjugate, product or sum built from tensor terms (and scalars)
bool is_tensor_expr(const Node& node);

/// @return true if @p node is a general tensor: a single tensor term,
/// possibly conjugated and multiplied by scalars
bool is_general_tensor(const Node& node);

/// a general tensor with conjugation folded into the term
struct GeneralTensor {
  /// the effective term; `conj(A[l;r])` is represented as `A'[r;l]`
  TensorTerm term;
  /// scalar prefactors, conjugated where they appeared under `conj`
  container::svector<NodePtr, 2> scalars;
};

/// @pre `is_general_tensor(*node)`
GeneralTensor decompose_general_tensor(const NodePtr& node);

/// @return true if some index appears twice on @p term
bool has_trace_indices(const TensorTerm& term);

/// calls @p fn on each immediate child of @p node; leaves and annotated
/// blocks have no children
void for_each_child(const Node& node,
                    const std::function<void(const NodePtr&)>& fn);

/// @return a copy of @p node with @p fn applied to its immediate children,
/// in order; leaves and annotated blocks are returned as-is
NodePtr map_children(const NodePtr& node,
                     const std::function<NodePtr(const NodePtr&)>& fn);

/// @return the tensor terms of @p node in order of appearance (not looking
/// into annotated blocks)
container::vector<TensorTerm> tensors(const NodePtr& node);

/// @return a copy of @p node with every tensor term replaced by @p fn(term)
NodePtr transform_terms(const NodePtr& node,
                        const std::function<NodePtr(const TensorTerm&)>& fn);

/// @return a copy of @p node with every index `i` replaced by @p fn(i)
NodePtr replace_indices(const NodePtr& node,
                        const std::function<Index(const Index&)>& fn);

/// @return the number of occurrences of each index of the tensor
/// expression @p node; a sum contributes the indices of its first summand
container::map<Index, std::size_t> index_counts(const NodePtr& node);

/// @return the indices that occur exactly once in @p node, in order of
/// appearance
IndexList free_indices(const NodePtr& node);

}  // namespace tnplanar

#endif  // TNPLANAR_EXPR_ALGORITHMS_HPP
