#include <TNPlanar/eval/executor.hpp>

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>
#include <TNPlanar/core/logger.hpp>
#include <TNPlanar/core/utility/exception.hpp>
#include <TNPlanar/planar/ordering.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/count.hpp>
#include <range/v3/algorithm/find.hpp>

#include <utility>

namespace tnplanar {

namespace {

template <typename... Args>
void log_execution(Args const&... args) {
  auto& l = Logger::instance();
  if (l.execute) write_log(l, args..., '\n');
}

/// @return position of @p i in @p list, if present
std::optional<std::size_t> position(const IndexList& list, const Index& i) {
  auto it = ranges::find(list, i);
  if (it == list.end()) return std::nullopt;
  return static_cast<std::size_t>(it - list.begin());
}

/// an evaluated tensor together with the indices of its legs
struct Labelled {
  TensorObjectPtr object;
  IndexList left;
  IndexList right;

  IndexList legs() const { return concat(left, right); }
  IndexList natural_order() const { return concat(left, reversed(right)); }
};

class Run {
 public:
  Run(const Plan& plan, const Backend& backend, bool strict)
      : plan_(plan),
        backend_(backend),
        strict_(strict),
        objects_(plan.objects.size()) {}

  Environment operator()(Environment env) {
    bind_existing(env);
    for (const auto& check : plan_.arity_checks)
      check.run(*objects_[check.object.value]);

    for (const auto& s : plan_.statements) execute(s, env);

    for (std::size_t h = 0; h != objects_.size(); ++h) {
      const auto& info = plan_.objects[ObjectHandle{h}];
      const bool exported =
          info.role == ObjectRole::Defined ||
          (info.role == ObjectRole::Existing && info.assigned);
      if (exported && objects_[h]) env.insert_or_assign(info.label, objects_[h]);
    }
    return env;
  }

 private:
  const Plan& plan_;
  const Backend& backend_;
  bool strict_;
  container::vector<TensorObjectPtr> objects_;

  std::string text(const NodePtr& node) const {
    return deparse(node, &plan_.objects);
  }

  void bind_existing(const Environment& env) {
    for (const auto& h : plan_.objects.handles(ObjectRole::Existing)) {
      const auto& label = plan_.objects[h].label;
      auto it = env.find(label);
      if (it == env.end() || !it->second)
        throw ExecutionError("unknown object " + label);
      objects_[h.value] = it->second;
    }
  }

  const TensorObjectPtr& object(ObjectHandle h) const {
    if (!objects_.at(h.value))
      throw ExecutionError("object " + plan_.objects[h].label +
                           " is used before it is defined");
    return objects_[h.value];
  }

  Space resolve(const SpaceExpr& s) const {
    auto result = object(s.object)->space(s.position);
    return s.dual ? result.dual() : result;
  }

  void execute(const NodePtr& node, Environment& env) {
    log_execution("execute: ", text(node));
    if (node->is<BraidingConstruction>()) {
      const auto& b = node->as<BraidingConstruction>();
      objects_[b.object.value] =
          backend_.braiding(resolve(b.space1), resolve(b.space2));
    } else if (node->is<Assignment>()) {
      assign(node->as<Assignment>(), env);
    } else if (node->is<OpaqueBlock>()) {
      throw ExecutionError("cannot execute opaque block " +
                           node->as<OpaqueBlock>().head);
    } else if (node->is<AnnotatedBlock>()) {
      log_execution("execute: skipping annotated block");
    } else if (is_tensor_expr(*node)) {
      // bare expression, evaluated for its checks only
      (void)evaluate_operand(node);
    }
  }

  void assign(const Assignment& a, Environment& env) {
    if (a.lhs->is<TensorTerm>()) {
      const auto& lhs = a.lhs->as<TensorTerm>();
      TNPLANAR_ASSERT(lhs.object.is_handle());
      auto value = evaluate(a.rhs, lhs.left, lhs.right);
      if (lhs.adjoint) value = backend_.adjoint(*value);
      auto& target = objects_[lhs.object.handle().value];
      if (!a.definition && target && !same_spaces(*target, *value))
        throw ExecutionError("cannot assign a tensor of different spaces to " +
                             plan_.objects[lhs.object.handle()].label);
      target = std::move(value);
      return;
    }
    const auto& lhs = a.lhs->as<ScalarTerm>();
    if (!std::holds_alternative<std::string>(lhs.value))
      throw ExecutionError("cannot assign to a number");
    env.insert_or_assign(std::get<std::string>(lhs.value),
                         evaluate(a.rhs, {}, {}));
  }

  /// @return @p node evaluated with the legs in the order `left ++ right`
  TensorObjectPtr evaluate(const NodePtr& node, const IndexList& left,
                           const IndexList& right) {
    if (node->is<Sum>()) {
      TensorObjectPtr result;
      for (const auto& s : node->as<Sum>().summands) {
        auto term = evaluate(s.term, left, right);
        if (!result)
          result = s.sign == Sign::Minus
                       ? backend_.scale(*term, *scalar(-1.0))
                       : std::move(term);
        else
          result = backend_.add(*result, *term, s.sign);
      }
      if (!result) throw ExecutionError("empty sum");
      return result;
    }

    if (node->is<Product>() && !is_general_tensor(*node)) {
      const auto& p = node->as<Product>();
      if (is_scalar(*p.left))
        return backend_.scale(*evaluate(p.right, left, right), *p.left);
      if (is_scalar(*p.right))
        return backend_.scale(*evaluate(p.left, left, right), *p.right);
      auto a = evaluate_operand(p.left);
      auto b = evaluate_operand(p.right);
      return contract(a, b, left, right, node);
    }

    return permute(evaluate_operand(node), left, right, node);
  }

  /// @return @p node evaluated with the legs in an order of its choosing
  Labelled evaluate_operand(const NodePtr& node) {
    if (is_general_tensor(*node)) return evaluate_general_tensor(node);

    if (strict_)
      throw ExecutionError("operand is not a single tensor: " + text(node));

    if (node->is<Product>()) {
      const auto& p = node->as<Product>();
      auto a = evaluate_operand(p.left);
      auto b = evaluate_operand(p.right);
      Labelled result;
      auto keep_open = [&](const IndexList& from, const Labelled& other,
                           IndexList& to) {
        for (const auto& i : from)
          if (!position(other.legs(), i)) to.push_back(i);
      };
      keep_open(a.left, b, result.left);
      keep_open(b.left, a, result.left);
      keep_open(a.right, b, result.right);
      keep_open(b.right, a, result.right);
      result.object = contract(a, b, result.left, result.right, node);
      return result;
    }

    if (node->is<Sum>()) {
      const auto& summands = node->as<Sum>().summands;
      if (summands.empty()) throw ExecutionError("empty sum");
      auto first = evaluate_operand(summands.front().term);
      Labelled result{.left = first.left, .right = first.right};
      result.object = evaluate(node, first.left, first.right);
      return result;
    }

    throw ExecutionError("cannot evaluate " + text(node));
  }

  Labelled evaluate_general_tensor(const NodePtr& node) {
    auto gt = decompose_general_tensor(node);
    const auto& t = gt.term;
    if (!t.object.is_handle())
      throw ExecutionError("unbound object " + text(node));

    auto obj = object(t.object.handle());
    if (t.adjoint) obj = backend_.adjoint(*obj);
    if (obj->numout() != t.left.size() || obj->numin() != t.right.size())
      throw ArityError("incorrect number of input-output indices: (" +
                           std::to_string(t.left.size()) + ", " +
                           std::to_string(t.right.size()) + ") instead of (" +
                           std::to_string(obj->numout()) + ", " +
                           std::to_string(obj->numin()) + ")",
                       text(node));
    for (const auto& s : gt.scalars) obj = backend_.scale(*obj, *s);

    Labelled result{.object = obj, .left = t.left, .right = t.right};
    if (!has_trace_indices(t)) return result;

    // trace out the legs that occur twice
    if (strict_ && !planar_trace_reduce(t.natural_order()))
      throw ExecutionError("trace is not planar: " + text(node));
    const auto legs = concat(t.left, t.right);
    PermutationSpec spec;
    IndexList left, right;
    for (std::size_t k = 0; k != legs.size(); ++k) {
      const auto n = ranges::count(legs, legs[k]);
      if (n == 1) {
        spec.output.push_back(k);
        (k < t.left.size() ? left : right).push_back(legs[k]);
      } else if (n == 2) {
        const auto other = *position(legs, legs[k]);
        if (other != k) spec.traces.emplace_back(other, k);
      } else {
        throw ExecutionError("index " + legs[k].to_string() +
                             " occurs more than twice in " + text(node));
      }
    }
    spec.numout = left.size();
    result.object = backend_.permute(*obj, spec);
    result.left = std::move(left);
    result.right = std::move(right);
    return result;
  }

  /// @return the contraction of @p a with @p b, with the legs in the order
  /// `left ++ right`
  TensorObjectPtr contract(const Labelled& a, const Labelled& b,
                           const IndexList& left, const IndexList& right,
                           const NodePtr& node) {
    const auto target = concat(left, reversed(right));
    if (strict_ &&
        !ranges::any_of(possible_planar_complements(a.natural_order(),
                                                    b.natural_order()),
                        [&target](const PlanarComplement& c) {
                          return is_cyclic_permutation(
                              concat(c.oind1, c.oind2), target);
                        }))
      throw ExecutionError("binary contraction is not planar: " + text(node));

    const auto legs_a = a.legs();
    const auto legs_b = b.legs();
    ContractionSpec spec;
    for (std::size_t k = 0; k != legs_a.size(); ++k)
      if (auto pb = position(legs_b, legs_a[k]))
        spec.contracted.emplace_back(k, *pb);
    for (const auto& i : concat(left, right)) {
      auto pa = position(legs_a, i);
      auto pb = position(legs_b, i);
      if (pa && !pb)
        spec.output.push_back({0, *pa});
      else if (pb && !pa)
        spec.output.push_back({1, *pb});
      else
        throw ExecutionError("index " + i.to_string() +
                             " is not an open leg of " + text(node));
    }
    spec.numout = left.size();
    return backend_.contract(*a.object, *b.object, spec);
  }

  TensorObjectPtr permute(const Labelled& a, const IndexList& left,
                          const IndexList& right, const NodePtr& node) {
    if (strict_ && !is_cyclic_permutation(a.natural_order(),
                                          concat(left, reversed(right))))
      throw ExecutionError("permutation is not planar: " + text(node));
    const auto legs = a.legs();
    PermutationSpec spec{.numout = left.size()};
    for (const auto& i : concat(left, right)) {
      auto p = position(legs, i);
      if (!p)
        throw ExecutionError("index " + i.to_string() + " is not a leg of " +
                             text(node));
      spec.output.push_back(*p);
    }
    return backend_.permute(*a.object, spec);
  }
};

}  // namespace

Environment Executor::run(const Plan& plan, Environment env) const {
  const bool strict =
      strict_.value_or(plan.braiding_mode == BraidingMode::Construct);
  return Run(plan, backend_, strict)(std::move(env));
}

}  // namespace tnplanar
