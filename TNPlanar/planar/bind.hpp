#ifndef TNPLANAR_PLANAR_BIND_HPP
#define TNPLANAR_PLANAR_BIND_HPP

#include <TNPlanar/core/context.hpp>
#include <TNPlanar/core/expr.hpp>

#include <cstddef>
#include <string>

namespace tnplanar {

/// @brief runtime check of the leg counts of an existing object

/// One check is emitted per distinct usage of an existing object; the
/// expected counts are those of the object's own (non-adjoint) frame.
struct ArityCheck {
  ObjectHandle object;
  std::size_t expected_out = 0;
  std::size_t expected_in = 0;
  /// display label of the object
  std::string label;

  /// @throw ArityError unless @p numout and @p numin match the expected counts
  void run(std::size_t numout, std::size_t numin) const;

  /// @tparam Query provides `numout()` and `numin()`
  template <typename Query>
  void run(const Query& query) const {
    run(query.numout(), query.numin());
  }

  friend bool operator==(const ArityCheck&, const ArityCheck&) = default;
};

struct BindResult {
  /// the distinct objects of the expression, in order of binding
  container::svector<ObjectHandle> objects;
  /// the expression with every object label replaced by its handle
  NodePtr expr;
  /// arity checks of the existing objects, in order of occurrence
  container::vector<ArityCheck> checks;
};

/// @brief binds the objects referenced by @p node to handles of @p table

/// Objects are bound in order: inputs (right-hand sides), outputs
/// (left-hand sides of `=`), then new objects (left-hand sides of `:=`).
/// Objects that are introduced by a definition are ObjectRole::Defined,
/// all others ObjectRole::Existing; targets of `=` are marked as assigned.
/// A reference and its adjoint bind to the same object. Braiding
/// placeholders and annotated blocks are left alone.
/// @throw ReservedNameError if the braiding placeholder is assigned to
BindResult bind_objects(const NodePtr& node, ObjectTable& table,
                        const Context& ctx = get_default_context());

}  // namespace tnplanar

#endif  // TNPLANAR_PLANAR_BIND_HPP
