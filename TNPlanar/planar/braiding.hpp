#ifndef TNPLANAR_PLANAR_BRAIDING_HPP
#define TNPLANAR_PLANAR_BRAIDING_HPP

#include <TNPlanar/core/context.hpp>
#include <TNPlanar/core/expr.hpp>

#include <cstddef>

namespace tnplanar {

/// @brief an immutable substitution of indices

/// Every update returns a new map; the map being traversed is never
/// modified.
class IndexMap {
 public:
  IndexMap() = default;

  /// @return the image of @p i, or @p i itself if it is not mapped
  Index operator()(const Index& i) const;

  bool contains(const Index& i) const { return map_.find(i) != map_.end(); }
  std::size_t size() const { return map_.size(); }
  bool empty() const { return map_.empty(); }

  /// @return a copy of this map with @p from mapped to @p to
  [[nodiscard]] IndexMap with(const Index& from, const Index& to) const;

  /// @return the transitive closure of this map, e.g. `{a→b, b→c}` becomes
  /// `{a→c, b→c}`
  [[nodiscard]] IndexMap closure() const;

  auto begin() const { return map_.begin(); }
  auto end() const { return map_.end(); }

  friend bool operator==(const IndexMap&, const IndexMap&) = default;

 private:
  container::map<Index, Index> map_;
};

/// @brief realizes braiding placeholders as constructed braiding objects

/// For every assignment with a tensor right-hand side, and every bare
/// tensor expression, the spaces of the legs of each placeholder are
/// derived from the neighbouring terms (the target of `=` counts as a
/// neighbour, as an adjoint); spaces shared between placeholders are
/// propagated until no more can be derived. Each placeholder is then bound
/// to a fresh ObjectRole::Braiding object of @p table, constructed by a
/// BraidingConstruction statement placed before the statement that uses it.
/// @pre objects of @p node are bound (see bind_objects())
/// @throw ReservedNameError if a placeholder does not have 2+2 legs
/// @throw UnresolvedBraidingError if the space of some strand cannot be
/// derived
NodePtr construct_braidings(const NodePtr& node, ObjectTable& table,
                            const Context& ctx = get_default_context());

/// @brief removes braiding placeholders by identifying the indices of each
/// strand

/// The representative of a strand is its index that is open on the
/// left-hand side, else the larger of two positional indices, else the
/// index on the incoming side of the placeholder. Placeholders that become
/// trivial are purged (see purge_braidings()).
/// @throw UnsafeBraidingRemovalError if both ends of a strand are open, or
/// if a placeholder does not become trivial
/// @throw ReservedNameError if a placeholder does not have 2+2 legs
NodePtr remove_braidings(const NodePtr& node,
                         const Context& ctx = get_default_context());

}  // namespace tnplanar

#endif  // TNPLANAR_PLANAR_BRAIDING_HPP
