#ifndef TNPLANAR_PLANAR_PLANARITY_HPP
#define TNPLANAR_PLANAR_PLANARITY_HPP

#include <TNPlanar/core/expr.hpp>

namespace tnplanar {

/// @brief verifies that every assignment of @p node can be drawn without
/// crossings

/// For each assignment with a tensor right-hand side, some planar order of
/// the right-hand side (see possible_planar_orders()) must be a cyclic
/// rotation of the natural order of the left-hand side. Annotated blocks
/// are skipped.
/// @param objects if nonnull, used for the labels in diagnostics
/// @return @p node
/// @throw PlanarityError if the right-hand side has no planar order, or
/// none matches the left-hand side
NodePtr check_planarity(const NodePtr& node,
                        const ObjectTable* objects = nullptr);

}  // namespace tnplanar

#endif  // TNPLANAR_PLANAR_PLANARITY_HPP
