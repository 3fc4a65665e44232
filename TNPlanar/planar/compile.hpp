#ifndef TNPLANAR_PLANAR_COMPILE_HPP
#define TNPLANAR_PLANAR_COMPILE_HPP

#include <TNPlanar/core/context.hpp>
#include <TNPlanar/core/expr.hpp>
#include <TNPlanar/planar/bind.hpp>

#include <string>

namespace tnplanar {

/// @brief a compiled diagram expression, ready for execution

/// The statements are flat: blocks are spliced into the enclosing
/// sequence, opaque and annotated blocks are kept as single statements.
struct Plan {
  ObjectTable objects;
  container::vector<ArityCheck> arity_checks;
  container::vector<NodePtr> statements;
  /// the mode the plan was compiled in; plans compiled in
  /// BraidingMode::Remove are not guaranteed to be planar
  BraidingMode braiding_mode = BraidingMode::Construct;

  /// @return handles of the temporaries, in order of creation
  container::svector<ObjectHandle> temporaries() const {
    return objects.handles(ObjectRole::Temporary);
  }

  /// @return the statements, one per line
  std::string to_string() const;
};

/// @brief compiles a diagram expression

/// Runs normalize_adjoint(), bind_objects(), then, depending on
/// `ctx.braiding_mode()`, either construct_braidings(), check_planarity()
/// (if `ctx.check_planarity()`) and decompose_contractions(), or
/// remove_braidings().
/// @throw CompilationError (or a subclass) if any pass fails; no partial
/// plan is returned
Plan compile(const NodePtr& node, const Context& ctx = get_default_context());

}  // namespace tnplanar

#endif  // TNPLANAR_PLANAR_COMPILE_HPP
