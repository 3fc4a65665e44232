#ifndef TNPLANAR_EXPR_HPP
#define TNPLANAR_EXPR_HPP

#include <TNPlanar/core/container.hpp>
#include <TNPlanar/core/index.hpp>
#include <TNPlanar/core/object.hpp>
#include <TNPlanar/core/space.hpp>
#include <TNPlanar/core/utility/macros.hpp>

#include <boost/core/demangle.hpp>

#include <initializer_list>
#include <memory>
#include <string>
#include <typeinfo>
#include <variant>

namespace tnplanar {

class Node;

/// expression trees are immutable and share their subtrees
using NodePtr = std::shared_ptr<const Node>;

/// @brief a reference to a tensor object with named legs, e.g. `A[a,b;c]`

/// @c left are the outgoing (codomain) legs and @c right the incoming
/// (domain) legs, both as written. `A'[r;l]` (adjoint) and `A[l;r]` refer to
/// the same underlying object.
struct TensorTerm {
  ObjectRef object;
  bool adjoint = false;
  IndexList left;
  IndexList right;

  std::size_t rank() const { return left.size() + right.size(); }

  /// @return `left ++ reverse(right)`, the cyclic order of the legs when the
  /// term is drawn as a planar vertex
  IndexList natural_order() const { return concat(left, reversed(right)); }

  /// @return the equivalent term with the adjoint flag flipped and the leg
  /// lists swapped
  TensorTerm adjointed() const { return {object, !adjoint, right, left}; }

  /// @return the outgoing legs of the underlying object
  const IndexList& object_left() const { return adjoint ? right : left; }
  /// @return the incoming legs of the underlying object
  const IndexList& object_right() const { return adjoint ? left : right; }

  friend bool operator==(const TensorTerm&, const TensorTerm&) = default;
};

/// a number or a named scalar
struct ScalarTerm {
  std::variant<double, std::string> value;

  friend bool operator==(const ScalarTerm&, const ScalarTerm&) = default;
};

/// complex conjugation, `conj(x)`
struct Conjugate {
  NodePtr arg;
};

enum class Sign { Plus, Minus };

struct Summand {
  Sign sign = Sign::Plus;
  NodePtr term;
};

/// linear combination `t0 ± t1 ± ...`; the sign of the first summand is
/// significant too
struct Sum {
  container::svector<Summand, 4> summands;
};

/// binary product (contraction) `left * right`
struct Product {
  NodePtr left;
  NodePtr right;
};

/// `lhs = rhs` (mutating) or `lhs := rhs` (definition)
struct Assignment {
  NodePtr lhs;
  NodePtr rhs;
  bool definition = false;
};

/// sequence of statements
struct Block {
  container::vector<NodePtr> statements;
};

/// control construct (loop, function) whose head is passed through as-is;
/// the body is subject to rewriting
struct OpaqueBlock {
  std::string head;
  NodePtr body;
};

/// region excluded from all rewriting
struct AnnotatedBlock {
  std::string annotation;
  NodePtr body;
};

/// statement `object ← braiding(space1, space2)`; the result maps
/// `space1 ⊗ space2` to `space2 ⊗ space1`
struct BraidingConstruction {
  ObjectHandle object;
  SpaceExpr space1;
  SpaceExpr space2;
};

/// @brief a node of an expression tree

/// Node is a closed sum type; passes dispatch over all alternatives with
/// std::visit or Node::is/Node::as.
class Node {
 public:
  using value_type =
      std::variant<TensorTerm, ScalarTerm, Conjugate, Sum, Product, Assignment,
                   Block, OpaqueBlock, AnnotatedBlock, BraidingConstruction>;

  template <typename T,
            typename = std::enable_if_t<
                std::is_constructible_v<value_type, T&&> &&
                !std::is_same_v<std::remove_cvref_t<T>, Node>>>
  Node(T&& value) : value_(std::forward<T>(value)) {}

  const value_type& value() const { return value_; }

  /// @tparam T a Node alternative
  /// @return true if this node holds a @c T
  template <typename T>
  bool is() const {
    return std::holds_alternative<T>(value_);
  }

  /// @tparam T a Node alternative
  /// @return the @c T held by this node
  template <typename T>
  const T& as() const {
    TNPLANAR_ASSERT(this->is<T>());
    return std::get<T>(value_);
  }

  template <typename Visitor>
  decltype(auto) visit(Visitor&& visitor) const {
    return std::visit(std::forward<Visitor>(visitor), value_);
  }

  /// @return the (demangled) name of the held alternative
  std::string type_name() const {
    return std::visit(
        [](const auto& v) { return boost::core::demangle(typeid(v).name()); },
        value_);
  }

 private:
  value_type value_;
};

/// @brief constructs an expression node
/// @tparam T a Node alternative, aggregate-initialized from @p args
template <typename T, typename... Args>
NodePtr ex(Args&&... args) {
  return std::make_shared<const Node>(T{std::forward<Args>(args)...});
}

/// \name builders of surface expressions
/// @{

/// @return `object[left;right]`
NodePtr tensor(ObjectRef object, IndexList left, IndexList right = {});

/// @return `object'[left;right]`, the adjoint reference
NodePtr adjoint(ObjectRef object, IndexList left, IndexList right = {});

NodePtr scalar(double value);
NodePtr scalar(std::string name);

/// @return `conj(arg)`
NodePtr conj(NodePtr arg);

/// @return the left fold of @p factors with `*`
NodePtr product(std::initializer_list<NodePtr> factors);

/// @return `lhs = rhs`
NodePtr assign(NodePtr lhs, NodePtr rhs);
/// @return `lhs := rhs`
NodePtr define(NodePtr lhs, NodePtr rhs);

NodePtr block(container::vector<NodePtr> statements);
NodePtr opaque(std::string head, NodePtr body);
NodePtr annotated(std::string annotation, NodePtr body);

NodePtr operator*(const NodePtr& left, const NodePtr& right);
NodePtr operator+(const NodePtr& left, const NodePtr& right);
NodePtr operator-(const NodePtr& left, const NodePtr& right);

/// @}

}  // namespace tnplanar

#endif  // TNPLANAR_EXPR_HPP
