#include <TNPlanar/core/expr.hpp>

#include <utility>

namespace tnplanar {

NodePtr tensor(ObjectRef object, IndexList left, IndexList right) {
  return ex<TensorTerm>(std::move(object), false, std::move(left),
                        std::move(right));
}

NodePtr adjoint(ObjectRef object, IndexList left, IndexList right) {
  return ex<TensorTerm>(std::move(object), true, std::move(left),
                        std::move(right));
}

NodePtr scalar(double value) { return ex<ScalarTerm>(value); }

NodePtr scalar(std::string name) { return ex<ScalarTerm>(std::move(name)); }

NodePtr conj(NodePtr arg) { return ex<Conjugate>(std::move(arg)); }

NodePtr product(std::initializer_list<NodePtr> factors) {
  TNPLANAR_ASSERT(factors.size() > 0);
  auto it = factors.begin();
  NodePtr result = *it;
  for (++it; it != factors.end(); ++it) result = result * *it;
  return result;
}

NodePtr assign(NodePtr lhs, NodePtr rhs) {
  return ex<Assignment>(std::move(lhs), std::move(rhs), false);
}

NodePtr define(NodePtr lhs, NodePtr rhs) {
  return ex<Assignment>(std::move(lhs), std::move(rhs), true);
}

NodePtr block(container::vector<NodePtr> statements) {
  return ex<Block>(std::move(statements));
}

NodePtr opaque(std::string head, NodePtr body) {
  return ex<OpaqueBlock>(std::move(head), std::move(body));
}

NodePtr annotated(std::string annotation, NodePtr body) {
  return ex<AnnotatedBlock>(std::move(annotation), std::move(body));
}

NodePtr operator*(const NodePtr& left, const NodePtr& right) {
  return ex<Product>(left, right);
}

namespace {

/// appends @p right to @p left with @p sign; a Sum on the left is extended
/// rather than nested
NodePtr append_summand(const NodePtr& left, Sign sign, const NodePtr& right) {
  Sum result;
  if (left->is<Sum>())
    result = left->as<Sum>();
  else
    result.summands.push_back({Sign::Plus, left});
  result.summands.push_back({sign, right});
  return ex<Sum>(std::move(result));
}

}  // namespace

NodePtr operator+(const NodePtr& left, const NodePtr& right) {
  return append_summand(left, Sign::Plus, right);
}

NodePtr operator-(const NodePtr& left, const NodePtr& right) {
  return append_summand(left, Sign::Minus, right);
}

}  // namespace tnplanar
