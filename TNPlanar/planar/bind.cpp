#include <TNPlanar/planar/bind.hpp>

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>
#include <TNPlanar/core/logger.hpp>
#include <TNPlanar/core/utility/exception.hpp>
#include <TNPlanar/planar/locate.hpp>

#include <range/v3/algorithm/find.hpp>

#include <functional>
#include <string>

namespace tnplanar {

void ArityCheck::run(std::size_t numout, std::size_t numin) const {
  if (numout != expected_out || numin != expected_in)
    throw ArityError("incorrect number of input-output indices: (" +
                         std::to_string(expected_out) + ", " +
                         std::to_string(expected_in) + ") instead of (" +
                         std::to_string(numout) + ", " +
                         std::to_string(numin) + ")",
                     label);
}

namespace {

/// labels referenced by a tree, each list in order of first appearance
struct ObjectLabels {
  container::vector<std::string> inputs;
  container::vector<std::string> outputs;
  container::vector<std::string> definitions;

  static void add(container::vector<std::string>& labels,
                  const TensorTerm& t) {
    if (!t.object.is_label()) return;
    if (ranges::find(labels, t.object.label()) == labels.end())
      labels.push_back(t.object.label());
  }
};

void collect_labels(const NodePtr& node, const Context& ctx,
                    ObjectLabels& labels) {
  if (node->is<AnnotatedBlock>()) return;
  if (node->is<Assignment>()) {
    const auto& a = node->as<Assignment>();
    for (const auto& t : tensors(a.rhs))
      if (!is_braiding(t, ctx)) ObjectLabels::add(labels.inputs, t);
    if (a.lhs->is<TensorTerm>()) {
      const auto& t = a.lhs->as<TensorTerm>();
      if (is_braiding(t, ctx))
        throw ReservedNameError("the name " + ctx.braiding_label() +
                                    " is reserved for the braiding, and "
                                    "should not be assigned to",
                                deparse(node));
      ObjectLabels::add(a.definition ? labels.definitions : labels.outputs, t);
    }
    return;
  }
  if (node->is<TensorTerm>()) {
    if (!is_braiding(node->as<TensorTerm>(), ctx))
      ObjectLabels::add(labels.inputs, node->as<TensorTerm>());
    return;
  }
  for_each_child(*node, [&](const NodePtr& child) {
    collect_labels(child, ctx, labels);
  });
}

}  // namespace

BindResult bind_objects(const NodePtr& node, ObjectTable& table,
                        const Context& ctx) {
  ObjectLabels labels;
  collect_labels(node, ctx, labels);

  auto is_defined = [&labels](const std::string& label) {
    return ranges::find(labels.definitions, label) != labels.definitions.end();
  };

  BindResult result;
  auto bind = [&](const std::string& label) {
    auto role = is_defined(label) ? ObjectRole::Defined : ObjectRole::Existing;
    auto h = table.bind(label, role);
    if (ranges::find(result.objects, h) == result.objects.end())
      result.objects.push_back(h);
    return h;
  };
  for (const auto& label : labels.inputs) bind(label);
  for (const auto& label : labels.outputs) table[bind(label)].assigned = true;
  for (const auto& label : labels.definitions) bind(label);

  result.expr = transform_terms(node, [&](const TensorTerm& t) -> NodePtr {
    if (!t.object.is_label() || is_braiding(t, ctx)) return ex<TensorTerm>(t);
    auto h = table.find(t.object.label());
    TNPLANAR_ASSERT(h.has_value());
    return ex<TensorTerm>(*h, t.adjoint, t.left, t.right);
  });

  for (const auto& t : tensors(result.expr)) {
    if (!t.object.is_handle()) continue;
    const auto& info = table[t.object.handle()];
    if (info.role != ObjectRole::Existing) continue;
    ArityCheck check{.object = t.object.handle(),
                     .expected_out = t.object_left().size(),
                     .expected_in = t.object_right().size(),
                     .label = info.label};
    if (ranges::find(result.checks, check) == result.checks.end())
      result.checks.push_back(std::move(check));
  }

  auto& l = Logger::instance();
  if (l.bind) {
    write_log(l, "bind_objects: ", deparse(result.expr, &table), "\n");
    for (const auto& h : result.objects)
      write_log(l, "  %", h.value, " = ", table[h].label, " (",
                to_string(table[h].role), table[h].assigned ? ", assigned" : "",
                ")\n");
  }
  return result;
}

}  // namespace tnplanar
