#include <TNPlanar/planar/planarity.hpp>

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>
#include <TNPlanar/core/logger.hpp>
#include <TNPlanar/core/utility/exception.hpp>
#include <TNPlanar/planar/ordering.hpp>

#include <range/v3/algorithm/any_of.hpp>

namespace tnplanar {

namespace {

void check_assignment(const NodePtr& node, const ObjectTable* objects) {
  const auto& a = node->as<Assignment>();
  if (!is_tensor_expr(*a.rhs)) return;

  IndexList target;
  if (a.lhs->is<TensorTerm>()) target = a.lhs->as<TensorTerm>().natural_order();

  const auto orders = possible_planar_orders(a.rhs);
  if (orders.empty())
    throw PlanarityError("not a planar diagram expression",
                         deparse(a.rhs, objects));
  if (!ranges::any_of(orders, [&target](const IndexList& order) {
        return is_cyclic_permutation(order, target);
      }))
    throw PlanarityError("not a planar diagram expression",
                         deparse(node, objects));

  auto& l = Logger::instance();
  if (l.planarity)
    write_log(l, "check_planarity: ", deparse(node, objects), " is planar\n");
}

void check_impl(const NodePtr& node, const ObjectTable* objects) {
  if (node->is<AnnotatedBlock>()) return;
  if (node->is<Assignment>()) return check_assignment(node, objects);
  for_each_child(*node, [objects](const NodePtr& child) {
    check_impl(child, objects);
  });
}

}  // namespace

NodePtr check_planarity(const NodePtr& node, const ObjectTable* objects) {
  check_impl(node, objects);
  return node;
}

}  // namespace tnplanar
