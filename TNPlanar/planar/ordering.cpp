#include <TNPlanar/planar/ordering.hpp>

#include <TNPlanar/core/expr_algorithms.hpp>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/count.hpp>
#include <range/v3/algorithm/find.hpp>

#include <algorithm>

namespace tnplanar {

IndexList rotated(const IndexList& order, std::size_t n) {
  IndexList result;
  const auto size = order.size();
  for (std::size_t i = 0; i != size; ++i) result.push_back(order[(i + n) % size]);
  return result;
}

bool is_cyclic_permutation(const IndexList& a, const IndexList& b) {
  if (a.size() != b.size()) return false;
  if (a.empty()) return true;
  for (std::size_t r = 0; r != a.size(); ++r)
    if (rotated(a, r) == b) return true;
  return false;
}

std::optional<IndexList> planar_trace_reduce(const IndexList& order) {
  if (ranges::any_of(order, [&order](const Index& i) {
        return ranges::count(order, i) > 2;
      }))
    return std::nullopt;

  IndexList result = order;
  bool changed = true;
  while (changed && result.size() >= 2) {
    changed = false;
    const auto n = result.size();
    for (std::size_t i = 0; i != n; ++i) {
      const auto j = (i + 1) % n;
      if (result[i] != result[j]) continue;
      // erase the later position first
      result.erase(result.begin() + std::max(i, j));
      result.erase(result.begin() + std::min(i, j));
      changed = true;
      break;
    }
  }

  if (ranges::any_of(result, [&result](const Index& i) {
        return ranges::count(result, i) > 1;
      }))
    return std::nullopt;
  return result;
}

container::vector<IndexList> possible_planar_orders(const NodePtr& node) {
  container::vector<IndexList> result;
  if (is_scalar(*node)) {
    result.emplace_back();
  } else if (is_general_tensor(*node)) {
    auto order =
        planar_trace_reduce(decompose_general_tensor(node).term.natural_order());
    if (order) result.push_back(std::move(*order));
  } else if (node->is<Product>()) {
    const auto& p = node->as<Product>();
    const auto orders2 = possible_planar_orders(p.right);
    for (const auto& ind1 : possible_planar_orders(p.left)) {
      for (const auto& ind2 : orders2) {
        for (const auto& c : possible_planar_complements(ind1, ind2)) {
          auto order = concat(c.oind1, c.oind2);
          if (ranges::find(result, order) == result.end())
            result.push_back(std::move(order));
        }
      }
    }
  } else if (node->is<Sum>()) {
    const auto& summands = node->as<Sum>().summands;
    if (summands.empty()) return result;
    container::vector<container::vector<IndexList>> others;
    for (std::size_t i = 1; i != summands.size(); ++i)
      others.push_back(possible_planar_orders(summands[i].term));
    for (auto& order : possible_planar_orders(summands.front().term)) {
      bool shared = true;
      for (const auto& orders : others)
        shared = shared && ranges::any_of(orders, [&order](const IndexList& o) {
                   return is_cyclic_permutation(o, order);
                 });
      if (shared) result.push_back(std::move(order));
    }
  }
  return result;
}

namespace {

/// the contiguous cyclic block of an order formed by the shared indices
struct SharedBlock {
  IndexList block;
  /// the remaining indices, starting right after the block
  IndexList rest;
};

/// @return the block of @p order formed by the indices satisfying
/// @p shared, or nullopt if they are not contiguous
template <typename Predicate>
std::optional<SharedBlock> shared_block(const IndexList& order,
                                        const Predicate& shared) {
  const auto n = order.size();
  std::optional<std::size_t> start;
  for (std::size_t i = 0; i != n; ++i) {
    if (shared(order[i]) && !shared(order[(i + n - 1) % n])) {
      if (start) return std::nullopt;  // two separate blocks
      start = i;
    }
  }
  if (!start) return std::nullopt;

  SharedBlock result;
  const auto r = rotated(order, *start);
  std::size_t k = 0;
  while (k != n && shared(r[k])) result.block.push_back(r[k++]);
  for (; k != n; ++k) result.rest.push_back(r[k]);
  return result;
}

}  // namespace

container::vector<PlanarComplement> possible_planar_complements(
    const IndexList& ind1, const IndexList& ind2) {
  container::vector<PlanarComplement> result;
  if (ind1.empty() || ind2.empty()) {
    result.push_back({.oind1 = ind1, .oind2 = ind2});
    return result;
  }

  auto in1 = [&ind1](const Index& i) {
    return ranges::find(ind1, i) != ind1.end();
  };
  auto in2 = [&ind2](const Index& i) {
    return ranges::find(ind2, i) != ind2.end();
  };

  if (!ranges::any_of(ind1, in2)) {
    for (std::size_t i = 0; i != ind1.size(); ++i)
      for (std::size_t j = 0; j != ind2.size(); ++j)
        result.push_back(
            {.oind1 = rotated(ind1, i), .oind2 = rotated(ind2, j)});
    return result;
  }

  const bool all1 = ranges::all_of(ind1, in2);
  const bool all2 = ranges::all_of(ind2, in1);
  if (all1 && all2) {
    // both operands fully contracted
    if (is_cyclic_permutation(reversed(ind1), ind2))
      result.push_back({.cind1 = ind1, .cind2 = reversed(ind1)});
  } else if (all1) {
    auto b2 = shared_block(ind2, in1);
    if (b2 && is_cyclic_permutation(reversed(b2->block), ind1))
      result.push_back({.oind2 = b2->rest,
                        .cind1 = reversed(b2->block),
                        .cind2 = b2->block});
  } else if (all2) {
    auto b1 = shared_block(ind1, in2);
    if (b1 && is_cyclic_permutation(reversed(b1->block), ind2))
      result.push_back({.oind1 = b1->rest,
                        .cind1 = b1->block,
                        .cind2 = reversed(b1->block)});
  } else {
    auto b1 = shared_block(ind1, in2);
    auto b2 = shared_block(ind2, in1);
    if (b1 && b2 && b2->block == reversed(b1->block))
      result.push_back({.oind1 = b1->rest,
                        .oind2 = b2->rest,
                        .cind1 = b1->block,
                        .cind2 = b2->block});
  }
  return result;
}

}  // namespace tnplanar
