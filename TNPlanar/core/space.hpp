#ifndef TNPLANAR_SPACE_HPP
#define TNPLANAR_SPACE_HPP

#include <TNPlanar/core/object.hpp>

#include <cstddef>
#include <string>

namespace tnplanar {

/// @brief descriptor of the vector space attached to a tensor leg

/// TNPlanar never inspects the structure of a space (sectors, degeneracies
/// are the backend's business); it only needs identity and duality.
class Space {
 public:
  Space() = default;
  explicit Space(std::string label, bool dual = false)
      : label_(std::move(label)), dual_(dual) {}

  const std::string& label() const { return label_; }
  bool is_dual() const { return dual_; }

  /// @return the dual of this space
  Space dual() const { return Space(label_, !dual_); }

  /// @return the label, primed if dual
  std::string to_string() const { return dual_ ? label_ + "'" : label_; }

  friend bool operator==(const Space&, const Space&) = default;

 private:
  std::string label_;
  bool dual_ = false;
};

/// @brief symbolic reference to the space of a leg of an object

/// Refers to leg @c position (codomain legs first, then domain legs) of
/// object @c object, in the object's own (non-adjoint) frame; if @c dual is
/// set the dual space is meant. Resolved at execution time.
struct SpaceExpr {
  ObjectHandle object;
  std::size_t position = 0;
  bool dual = false;

  /// @return the dual of this space expression
  SpaceExpr dualized() const { return {object, position, !dual}; }

  friend bool operator==(const SpaceExpr&, const SpaceExpr&) = default;
};

}  // namespace tnplanar

#endif  // TNPLANAR_SPACE_HPP
