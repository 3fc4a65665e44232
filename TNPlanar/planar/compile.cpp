#include <TNPlanar/planar/compile.hpp>

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/planar/braiding.hpp>
#include <TNPlanar/planar/decompose.hpp>
#include <TNPlanar/planar/normalize.hpp>
#include <TNPlanar/planar/planarity.hpp>

#include <utility>

namespace tnplanar {

namespace {

void flatten(const NodePtr& node, container::vector<NodePtr>& statements) {
  if (node->is<Block>()) {
    for (const auto& s : node->as<Block>().statements) flatten(s, statements);
  } else {
    statements.push_back(node);
  }
}

}  // namespace

std::string Plan::to_string() const {
  std::string result;
  for (const auto& s : statements) {
    result += deparse(s, &objects);
    result += "\n";
  }
  return result;
}

Plan compile(const NodePtr& node, const Context& ctx) {
  Plan plan{.objects = ObjectTable(ctx.temporary_prefix()),
            .braiding_mode = ctx.braiding_mode()};

  auto expr = normalize_adjoint(node);
  auto bound = bind_objects(expr, plan.objects, ctx);
  plan.arity_checks = std::move(bound.checks);
  expr = std::move(bound.expr);

  switch (ctx.braiding_mode()) {
    case BraidingMode::Construct:
      expr = construct_braidings(expr, plan.objects, ctx);
      if (ctx.check_planarity()) check_planarity(expr, &plan.objects);
      expr = decompose_contractions(expr, plan.objects);
      break;
    case BraidingMode::Remove:
      expr = remove_braidings(expr, ctx);
      break;
  }

  flatten(expr, plan.statements);
  return plan;
}

}  // namespace tnplanar
