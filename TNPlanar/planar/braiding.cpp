#include <TNPlanar/planar/braiding.hpp>

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>
#include <TNPlanar/core/logger.hpp>
#include <TNPlanar/core/utility/exception.hpp>
#include <TNPlanar/planar/locate.hpp>
#include <TNPlanar/planar/normalize.hpp>

#include <range/v3/algorithm/find.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace tnplanar {

Index IndexMap::operator()(const Index& i) const {
  auto it = map_.find(i);
  return it == map_.end() ? i : it->second;
}

IndexMap IndexMap::with(const Index& from, const Index& to) const {
  IndexMap result(*this);
  result.map_.insert_or_assign(from, to);
  return result;
}

IndexMap IndexMap::closure() const {
  IndexMap current(*this);
  // each pass shortens every chain, hence an acyclic map converges in at
  // most size() passes
  for (std::size_t pass = 0; pass <= size(); ++pass) {
    IndexMap next;
    bool changed = false;
    for (const auto& [k, v] : current.map_) {
      auto it = current.map_.find(v);
      if (it != current.map_.end() && it->second != v) {
        next.map_.emplace(k, it->second);
        changed = true;
      } else {
        next.map_.emplace(k, v);
      }
    }
    if (!changed) return current;
    current = std::move(next);
  }
  throw Exception("IndexMap::closure: the map is cyclic");
}

namespace {

/// the two indices of a braiding strand; `a` is on the incoming side of the
/// placeholder, `b` on the outgoing side
struct Strand {
  Index a;
  Index b;
};

std::string to_string(const container::vector<Strand>& strands) {
  std::string result;
  for (const auto& s : strands) {
    if (!result.empty()) result += ", ";
    result += "(" + s.a.to_string() + ", " + s.b.to_string() + ")";
  }
  return result;
}

/// @return the strands of placeholder @p t, `τ[i2b,i1b; i1a,i2a]` or
/// `τ'[i1b,i2b; i2a,i1a]`
std::pair<Strand, Strand> strands(const TensorTerm& t, const Context& ctx) {
  if (t.left.size() != 2 || t.right.size() != 2)
    throw ReservedNameError(
        "the name " + ctx.braiding_label() +
            " is reserved for the braiding, and should have two input and two "
            "output indices",
        deparse(t));
  if (t.adjoint)
    return {Strand{t.right[1], t.left[0]}, Strand{t.right[0], t.left[1]}};
  return {Strand{t.right[0], t.left[1]}, Strand{t.right[1], t.left[0]}};
}

/// the terms of a statement that take part in braiding resolution
struct StatementTerms {
  container::vector<TensorTerm> placeholders;
  container::vector<TensorTerm> neighbours;
  IndexList outgoing;
};

/// @return the terms of @p node if it is an assignment with a tensor
/// right-hand side or a bare tensor expression
std::optional<StatementTerms> statement_terms(const NodePtr& node,
                                              const Context& ctx) {
  StatementTerms result;
  container::vector<TensorTerm> terms;
  if (node->is<Assignment>()) {
    const auto& a = node->as<Assignment>();
    if (!is_tensor_expr(*a.rhs)) return std::nullopt;
    terms = tensors(normalize_adjoint(a.rhs));
    if (a.lhs->is<TensorTerm>()) {
      const auto& lhs = a.lhs->as<TensorTerm>();
      result.outgoing = concat(lhs.left, lhs.right);
      if (!a.definition) terms.push_back(lhs.adjointed());
    }
  } else if (is_tensor_expr(*node)) {
    terms = tensors(normalize_adjoint(node));
  } else {
    return std::nullopt;
  }
  for (auto& t : terms) {
    if (!is_braiding(t, ctx))
      result.neighbours.push_back(std::move(t));
    else if (ranges::find(result.placeholders, t) == result.placeholders.end())
      result.placeholders.push_back(std::move(t));
  }
  return result;
}

class BraidingConstructor {
 public:
  BraidingConstructor(ObjectTable& table, const Context& ctx)
      : table_(table), ctx_(ctx) {}

  NodePtr operator()(const NodePtr& node) {
    if (node->is<AnnotatedBlock>()) return node;
    if (node->is<Assignment>() || is_tensor_expr(*node)) {
      auto terms = statement_terms(node, ctx_);
      if (!terms || terms->placeholders.empty()) return node;
      return construct(normalize_adjoint(node), *terms);
    }
    return map_children(node, [this](const NodePtr& child) {
      return (*this)(child);
    });
  }

 private:
  ObjectTable& table_;
  const Context& ctx_;

  NodePtr construct(const NodePtr& node, const StatementTerms& terms) {
    container::map<Index, SpaceExpr> spaces;
    container::vector<Strand> unresolved;
    auto resolve = [&](const Strand& s) {
      if (auto loc = locate(s.a, terms.neighbours)) {
        spaces.insert_or_assign(s.a, loc->space());
        spaces.insert_or_assign(s.b, loc->space());
      } else if (auto loc = locate(s.b, terms.neighbours)) {
        spaces.insert_or_assign(s.a, loc->space().dualized());
        spaces.insert_or_assign(s.b, loc->space().dualized());
      } else {
        unresolved.push_back(s);
      }
    };
    for (const auto& t : terms.placeholders) {
      auto [s1, s2] = strands(t, ctx_);
      resolve(s1);
      resolve(s2);
    }

    // strands that share an index with a resolved strand carry its space
    bool changed = true;
    while (changed) {
      changed = false;
      for (std::size_t i = 0; i < unresolved.size();) {
        const auto& s = unresolved[i];
        if (auto known = spaces.find(s.a); known != spaces.end()) {
          const auto space = known->second;
          spaces.insert_or_assign(s.b, space);
        } else if (auto known = spaces.find(s.b); known != spaces.end()) {
          const auto space = known->second;
          spaces.insert_or_assign(s.a, space);
        } else {
          ++i;
          continue;
        }
        unresolved.erase(unresolved.begin() + i);
        changed = true;
      }
    }
    if (!unresolved.empty())
      throw UnresolvedBraidingError(
          "cannot determine the spaces of indices " + to_string(unresolved) +
              " for the braiding tensors",
          deparse(node, &table_));

    container::vector<NodePtr> statements;
    container::vector<std::pair<TensorTerm, ObjectHandle>> handles;
    for (const auto& t : terms.placeholders) {
      auto [s1, s2] = strands(t, ctx_);
      auto h = table_.make_braiding();
      statements.push_back(ex<BraidingConstruction>(h, spaces.at(s1.b),
                                                    spaces.at(s2.b)));
      handles.emplace_back(t, h);
    }
    statements.push_back(transform_terms(node, [&](const TensorTerm& t) {
      for (const auto& [placeholder, h] : handles)
        if (t == placeholder)
          return ex<TensorTerm>(h, t.adjoint, t.left, t.right);
      return ex<TensorTerm>(t);
    }));
    auto result = block(std::move(statements));

    auto& l = Logger::instance();
    if (l.braiding)
      write_log(l, "construct_braidings: ", deparse(node, &table_), "\n  -> ",
                deparse(result, &table_), "\n");
    return result;
  }
};

class BraidingRemover {
 public:
  explicit BraidingRemover(const Context& ctx) : ctx_(ctx) {}

  NodePtr operator()(const NodePtr& node) const {
    if (node->is<AnnotatedBlock>()) return node;
    if (node->is<Assignment>() || is_tensor_expr(*node)) {
      auto terms = statement_terms(node, ctx_);
      if (!terms || terms->placeholders.empty()) return node;
      return remove(normalize_adjoint(node), *terms);
    }
    return map_children(node, *this);
  }

 private:
  const Context& ctx_;

  NodePtr remove(const NodePtr& node, const StatementTerms& terms) const {
    auto is_outgoing = [&terms](const Index& i) {
      return ranges::find(terms.outgoing, i) != terms.outgoing.end();
    };

    // strand ends are resolved to their representatives before they are
    // identified; only representatives are redirected
    IndexMap map;
    auto identify = [&](const Strand& s) {
      const auto closed = map.closure();
      const auto a = closed(s.a);
      const auto b = closed(s.b);
      if (a == b) return;
      const bool a_out = is_outgoing(a);
      const bool b_out = is_outgoing(b);
      if (a_out && b_out)
        throw UnsafeBraidingRemovalError(
            "removing the braiding would identify the open indices " +
                a.to_string() + " and " + b.to_string(),
            deparse(node));
      Index rep = a;
      if (b_out)
        rep = b;
      else if (!a_out && a.positional() && b.positional())
        rep = std::max(a, b);
      map = map.with(a, rep).with(b, rep);
    };
    for (const auto& t : terms.placeholders) {
      auto [s1, s2] = strands(t, ctx_);
      identify(s1);
      identify(s2);
    }
    map = map.closure();

    auto result = purge_braidings(
        replace_indices(node, [&map](const Index& i) { return map(i); }),
        ctx_);

    auto& l = Logger::instance();
    if (l.braiding)
      write_log(l, "remove_braidings: ", deparse(node), "\n  -> ",
                deparse(result), "\n");
    return result;
  }
};

}  // namespace

NodePtr construct_braidings(const NodePtr& node, ObjectTable& table,
                            const Context& ctx) {
  BraidingConstructor constructor(table, ctx);
  return constructor(node);
}

NodePtr remove_braidings(const NodePtr& node, const Context& ctx) {
  return BraidingRemover{ctx}(node);
}

}  // namespace tnplanar
