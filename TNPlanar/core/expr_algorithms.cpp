#include <TNPlanar/core/expr_algorithms.hpp>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/count.hpp>

#include <utility>

namespace tnplanar {

bool is_scalar(const Node& node) {
  if (node.is<ScalarTerm>()) return true;
  if (node.is<Conjugate>()) return is_scalar(*node.as<Conjugate>().arg);
  if (node.is<Product>()) {
    const auto& p = node.as<Product>();
    return is_scalar(*p.left) && is_scalar(*p.right);
  }
  if (node.is<Sum>()) {
    return ranges::all_of(node.as<Sum>().summands,
                          [](const Summand& s) { return is_scalar(*s.term); });
  }
  return false;
}

bool is_tensor_expr(const Node& node) {
  if (node.is<TensorTerm>()) return true;
  if (node.is<Conjugate>()) return is_tensor_expr(*node.as<Conjugate>().arg);
  if (node.is<Product>()) {
    const auto& p = node.as<Product>();
    const bool l = is_tensor_expr(*p.left);
    const bool r = is_tensor_expr(*p.right);
    return (l && (r || is_scalar(*p.right))) || (r && is_scalar(*p.left));
  }
  if (node.is<Sum>()) {
    const auto& summands = node.as<Sum>().summands;
    return !summands.empty() &&
           ranges::all_of(summands, [](const Summand& s) {
             return is_tensor_expr(*s.term);
           });
  }
  return false;
}

bool is_general_tensor(const Node& node) {
  if (node.is<TensorTerm>()) return true;
  if (node.is<Conjugate>())
    return is_general_tensor(*node.as<Conjugate>().arg);
  if (node.is<Product>()) {
    const auto& p = node.as<Product>();
    return (is_general_tensor(*p.left) && is_scalar(*p.right)) ||
           (is_scalar(*p.left) && is_general_tensor(*p.right));
  }
  return false;
}

namespace {

void decompose_general_tensor_impl(const NodePtr& node, bool conjugated,
                                   GeneralTensor& result) {
  if (node->is<TensorTerm>()) {
    const auto& t = node->as<TensorTerm>();
    result.term = conjugated ? t.adjointed() : t;
  } else if (node->is<Conjugate>()) {
    decompose_general_tensor_impl(node->as<Conjugate>().arg, !conjugated,
                                  result);
  } else if (node->is<Product>()) {
    const auto& p = node->as<Product>();
    const bool left_is_scalar = is_scalar(*p.left);
    const auto& s = left_is_scalar ? p.left : p.right;
    result.scalars.push_back(conjugated ? conj(s) : s);
    decompose_general_tensor_impl(left_is_scalar ? p.right : p.left,
                                  conjugated, result);
  } else {
    TNPLANAR_UNREACHABLE;
  }
}

}  // namespace

GeneralTensor decompose_general_tensor(const NodePtr& node) {
  TNPLANAR_ASSERT(is_general_tensor(*node));
  GeneralTensor result;
  decompose_general_tensor_impl(node, false, result);
  return result;
}

bool has_trace_indices(const TensorTerm& term) {
  const auto all = concat(term.left, term.right);
  return ranges::any_of(
      all, [&all](const Index& i) { return ranges::count(all, i) > 1; });
}

NodePtr map_children(const NodePtr& node,
                     const std::function<NodePtr(const NodePtr&)>& fn) {
  return node->visit([&](const auto& v) -> NodePtr {
    using T = std::remove_cvref_t<decltype(v)>;
    if constexpr (std::is_same_v<T, Conjugate>) {
      return ex<Conjugate>(fn(v.arg));
    } else if constexpr (std::is_same_v<T, Sum>) {
      Sum result;
      for (const auto& s : v.summands)
        result.summands.push_back({s.sign, fn(s.term)});
      return ex<Sum>(std::move(result));
    } else if constexpr (std::is_same_v<T, Product>) {
      auto left = fn(v.left);
      auto right = fn(v.right);
      return ex<Product>(std::move(left), std::move(right));
    } else if constexpr (std::is_same_v<T, Assignment>) {
      auto lhs = fn(v.lhs);
      auto rhs = fn(v.rhs);
      return ex<Assignment>(std::move(lhs), std::move(rhs), v.definition);
    } else if constexpr (std::is_same_v<T, Block>) {
      Block result;
      result.statements.reserve(v.statements.size());
      for (const auto& s : v.statements) result.statements.push_back(fn(s));
      return ex<Block>(std::move(result));
    } else if constexpr (std::is_same_v<T, OpaqueBlock>) {
      return ex<OpaqueBlock>(v.head, fn(v.body));
    } else {
      // leaves and annotated blocks
      return node;
    }
  });
}

void for_each_child(const Node& node,
                    const std::function<void(const NodePtr&)>& fn) {
  node.visit([&fn](const auto& v) {
    using T = std::remove_cvref_t<decltype(v)>;
    if constexpr (std::is_same_v<T, Conjugate>) {
      fn(v.arg);
    } else if constexpr (std::is_same_v<T, Sum>) {
      for (const auto& s : v.summands) fn(s.term);
    } else if constexpr (std::is_same_v<T, Product>) {
      fn(v.left);
      fn(v.right);
    } else if constexpr (std::is_same_v<T, Assignment>) {
      fn(v.lhs);
      fn(v.rhs);
    } else if constexpr (std::is_same_v<T, Block>) {
      for (const auto& s : v.statements) fn(s);
    } else if constexpr (std::is_same_v<T, OpaqueBlock>) {
      fn(v.body);
    }
  });
}

namespace {

void collect_tensors(const NodePtr& node,
                     container::vector<TensorTerm>& result) {
  if (node->is<TensorTerm>()) {
    result.push_back(node->as<TensorTerm>());
    return;
  }
  for_each_child(*node, [&result](const NodePtr& child) {
    collect_tensors(child, result);
  });
}

}  // namespace

container::vector<TensorTerm> tensors(const NodePtr& node) {
  container::vector<TensorTerm> result;
  collect_tensors(node, result);
  return result;
}

NodePtr transform_terms(const NodePtr& node,
                        const std::function<NodePtr(const TensorTerm&)>& fn) {
  if (node->is<TensorTerm>()) return fn(node->as<TensorTerm>());
  return map_children(node, [&fn](const NodePtr& child) {
    return transform_terms(child, fn);
  });
}

NodePtr replace_indices(const NodePtr& node,
                        const std::function<Index(const Index&)>& fn) {
  auto replace = [&fn](const IndexList& indices) {
    IndexList result;
    for (const auto& i : indices) result.push_back(fn(i));
    return result;
  };
  return transform_terms(node, [&](const TensorTerm& t) {
    return ex<TensorTerm>(t.object, t.adjoint, replace(t.left),
                          replace(t.right));
  });
}

container::map<Index, std::size_t> index_counts(const NodePtr& node) {
  container::map<Index, std::size_t> result;
  if (node->is<Sum>()) {
    const auto& summands = node->as<Sum>().summands;
    if (!summands.empty()) return index_counts(summands.front().term);
    return result;
  }
  if (node->is<TensorTerm>()) {
    const auto& t = node->as<TensorTerm>();
    for (const auto& i : t.left) ++result[i];
    for (const auto& i : t.right) ++result[i];
    return result;
  }
  if (node->is<Conjugate>()) return index_counts(node->as<Conjugate>().arg);
  if (node->is<Product>()) {
    const auto& p = node->as<Product>();
    result = index_counts(p.left);
    for (const auto& [i, n] : index_counts(p.right)) result[i] += n;
  }
  return result;
}

IndexList free_indices(const NodePtr& node) {
  const auto counts = index_counts(node);
  IndexList result;
  auto visit_term = [&](const TensorTerm& t) {
    for (const auto& list : {std::cref(t.left), std::cref(t.right)})
      for (const auto& i : list.get())
        if (auto it = counts.find(i); it != counts.end() && it->second == 1)
          result.push_back(i);
  };
  NodePtr first = node;
  if (node->is<Sum>() && !node->as<Sum>().summands.empty())
    first = node->as<Sum>().summands.front().term;
  for (const auto& t : tensors(first)) visit_term(t);
  return result;
}

}  // namespace tnplanar
