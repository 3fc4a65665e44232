#ifndef TNPLANAR_PLANAR_LOCATE_HPP
#define TNPLANAR_PLANAR_LOCATE_HPP

#include <TNPlanar/core/context.hpp>
#include <TNPlanar/core/expr.hpp>

#include <cstddef>
#include <optional>

namespace tnplanar {

/// the leg of a tensor term that carries a given index
struct LegLocation {
  ObjectRef object;
  bool adjoint = false;
  /// position of the leg in the term as written (left legs first)
  std::size_t position = 0;
  /// position of the leg in the underlying object (codomain legs first)
  std::size_t object_position = 0;

  /// @return the outward space of the leg as seen by the term, i.e. the
  /// space of the object's leg, dualized if the term is an adjoint
  /// @pre `object.is_handle()`
  SpaceExpr space() const;
};

/// @return the location of the first leg carrying @p index in @p terms;
/// the left legs of a term are searched before its right legs
std::optional<LegLocation> locate(const Index& index,
                                  const container::vector<TensorTerm>& terms);

/// @return true if @p term refers to the braiding placeholder of @p ctx
bool is_braiding(const TensorTerm& term,
                 const Context& ctx = get_default_context());

/// @brief removes braiding placeholders from the products of @p node

/// A placeholder factor `τ[a,b;c,d]` (bare or conjugated) is removable
/// only if it is trivial after index renaming, i.e. `a == d` and `b == c`.
/// A product left with one factor collapses to it, a product of
/// placeholders only to the scalar 1.
/// @throw UnsafeBraidingRemovalError if a placeholder is not trivial or is
/// not a factor of a product
/// @throw ReservedNameError if a placeholder does not have 2+2 legs
NodePtr purge_braidings(const NodePtr& node,
                        const Context& ctx = get_default_context());

}  // namespace tnplanar

#endif  // TNPLANAR_PLANAR_LOCATE_HPP
