#include <TNPlanar/planar/locate.hpp>

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>
#include <TNPlanar/core/utility/exception.hpp>

#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/none_of.hpp>

#include <utility>

namespace tnplanar {

SpaceExpr LegLocation::space() const {
  TNPLANAR_ASSERT(object.is_handle());
  return {object.handle(), object_position, adjoint};
}

std::optional<LegLocation> locate(const Index& index,
                                  const container::vector<TensorTerm>& terms) {
  for (const auto& t : terms) {
    std::optional<std::size_t> pos;
    if (auto it = ranges::find(t.left, index); it != t.left.end())
      pos = static_cast<std::size_t>(it - t.left.begin());
    else if (auto it = ranges::find(t.right, index); it != t.right.end())
      pos = t.left.size() + static_cast<std::size_t>(it - t.right.begin());
    if (!pos) continue;

    LegLocation result{
        .object = t.object, .adjoint = t.adjoint, .position = *pos};
    if (!t.adjoint)
      result.object_position = *pos;
    else if (*pos < t.left.size())  // left legs of t' are the domain of t
      result.object_position = t.right.size() + *pos;
    else
      result.object_position = *pos - t.left.size();
    return result;
  }
  return std::nullopt;
}

bool is_braiding(const TensorTerm& term, const Context& ctx) {
  return term.object.is_label() &&
         term.object.label() == ctx.braiding_label();
}

namespace {

void flatten_product(const NodePtr& node, container::vector<NodePtr>& factors) {
  if (node->is<Product>()) {
    flatten_product(node->as<Product>().left, factors);
    flatten_product(node->as<Product>().right, factors);
  } else {
    factors.push_back(node);
  }
}

class Purger {
 public:
  explicit Purger(const Context& ctx) : ctx_(ctx) {}

  NodePtr operator()(const NodePtr& node) const {
    if (node->is<Product>()) return purge_product(node);
    if (node->is<TensorTerm>() && is_braiding(node->as<TensorTerm>(), ctx_))
      throw UnsafeBraidingRemovalError(
          "unable to remove braiding tensor that is not a factor of a product",
          deparse(node));
    return map_children(node, *this);
  }

 private:
  const Context& ctx_;

  /// @return the placeholder term of @p node, if @p node is a placeholder or
  /// its conjugate
  const TensorTerm* placeholder(const NodePtr& node) const {
    const Node* n = node.get();
    if (n->is<Conjugate>()) n = n->as<Conjugate>().arg.get();
    if (n->is<TensorTerm>() && is_braiding(n->as<TensorTerm>(), ctx_))
      return &n->as<TensorTerm>();
    return nullptr;
  }

  NodePtr purge_product(const NodePtr& node) const {
    container::vector<NodePtr> factors;
    flatten_product(node, factors);
    if (ranges::none_of(factors, [this](const NodePtr& f) {
          return placeholder(f) != nullptr;
        })) {
      const auto& p = node->as<Product>();
      auto left = (*this)(p.left);
      auto right = (*this)(p.right);
      return ex<Product>(std::move(left), std::move(right));
    }

    container::vector<NodePtr> kept;
    for (const auto& f : factors) {
      const auto* t = placeholder(f);
      if (!t) {
        kept.push_back((*this)(f));
        continue;
      }
      if (t->left.size() != 2 || t->right.size() != 2)
        throw ReservedNameError(
            "the name " + ctx_.braiding_label() +
                " is reserved for the braiding, and should have two input "
                "and two output indices",
            deparse(f));
      if (!(t->left[0] == t->right[1] && t->left[1] == t->right[0]))
        throw UnsafeBraidingRemovalError("unable to remove braiding tensor",
                                         deparse(f));
    }

    if (kept.empty()) return scalar(1.0);
    NodePtr result = kept.front();
    for (std::size_t i = 1; i != kept.size(); ++i) result = result * kept[i];
    return result;
  }
};

}  // namespace

NodePtr purge_braidings(const NodePtr& node, const Context& ctx) {
  return Purger{ctx}(node);
}

}  // namespace tnplanar
