#include <catch2/catch_test_macros.hpp>

#include "catch2_tnplanar.hpp"

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>
#include <TNPlanar/core/index.hpp>
#include <TNPlanar/core/object.hpp>

#include <string>

TEST_CASE("index", "[elements]") {
  using namespace tnplanar;

  SECTION("construction") {
    Index i1(1);
    Index a("a");
    REQUIRE(i1.positional());
    REQUIRE(!i1.symbolic());
    REQUIRE(i1.ordinal() == 1);
    REQUIRE(a.symbolic());
    REQUIRE(a.label() == "a");
    REQUIRE(i1.to_string() == "1");
    REQUIRE(a.to_string() == "a");
  }

  SECTION("ordering") {
    REQUIRE(Index(1) < Index(2));
    REQUIRE(Index(2) < Index("a"));
    REQUIRE(Index("a") < Index("b"));
    REQUIRE(Index("a") == Index("a"));
    REQUIRE(Index(1) != Index("1"));
  }

  SECTION("lists") {
    IndexList l{"a", "b", 3};
    REQUIRE(to_string(l) == "a,b,3");
    REQUIRE(reversed(l) == IndexList{3, "b", "a"});
    REQUIRE(concat(l, IndexList{"c"}) == IndexList{"a", "b", 3, "c"});
    REQUIRE(to_string(IndexList{}).empty());
  }
}

TEST_CASE("expr", "[elements]") {
  using namespace tnplanar;

  SECTION("tensor terms") {
    auto t = tensor("A", {"a", "b"}, {"c", "d"});
    REQUIRE(t->is<TensorTerm>());
    const auto& term = t->as<TensorTerm>();
    REQUIRE(term.object == ObjectRef("A"));
    REQUIRE(!term.adjoint);
    REQUIRE(term.rank() == 4);
    REQUIRE(term.natural_order() == IndexList{"a", "b", "d", "c"});

    auto adj = term.adjointed();
    REQUIRE(adj.adjoint);
    REQUIRE(adj.left == IndexList{"c", "d"});
    REQUIRE(adj.right == IndexList{"a", "b"});
    REQUIRE(adj.object_left() == term.left);
    REQUIRE(adj.object_right() == term.right);
    REQUIRE(adj.adjointed() == term);
  }

  SECTION("deparse") {
    auto A = tensor("A", {"a"}, {"b"});
    auto B = tensor("B", {"b"}, {"c"});
    REQUIRE(deparse(A) == "A[a;b]");
    REQUIRE(deparse(adjoint("A", {"b"}, {"a"})) == "A'[b;a]");
    REQUIRE(deparse(tensor("A", {"a", "b"})) == "A[a,b;]");
    REQUIRE(deparse(tensor("A", {1, 2}, {3})) == "A[1,2;3]");
    REQUIRE(deparse(scalar(2.0)) == "2");
    REQUIRE(deparse(scalar(0.5)) == "0.5");
    REQUIRE(deparse(scalar("α")) == "α");
    REQUIRE(deparse(conj(A)) == "conj(A[a;b])");
    REQUIRE(deparse(A * B) == "A[a;b] * B[b;c]");
    REQUIRE(deparse(product({scalar("α"), A, B})) ==
            "α * A[a;b] * B[b;c]");
    REQUIRE(deparse(A - tensor("C", {"a"}, {"b"})) == "A[a;b] - C[a;b]");
    REQUIRE(deparse((A + tensor("C", {"a"}, {"b"})) * B) ==
            "(A[a;b] + C[a;b]) * B[b;c]");
    REQUIRE(deparse(define(tensor("D", {"a"}, {"c"}), A * B)) ==
            "D[a;c] := A[a;b] * B[b;c]");
    REQUIRE(deparse(assign(tensor("D", {"a"}, {"c"}), A * B)) ==
            "D[a;c] = A[a;b] * B[b;c]");
    REQUIRE(deparse(block({define(tensor("D", {"a"}, {"b"}), A),
                           assign(tensor("E", {"a"}, {"b"}), A)})) ==
            "D[a;b] := A[a;b]\nE[a;b] = A[a;b]");
    REQUIRE(deparse(opaque("for k in 1:3", A)) ==
            "for k in 1:3 {\n  A[a;b]\n}");
    REQUIRE(deparse(annotated("keep", A)) == "@keep {\n  A[a;b]\n}");
  }

  SECTION("deparse bound objects") {
    ObjectTable table;
    auto h = table.bind("A", ObjectRole::Existing);
    auto b = table.make_braiding();
    auto t = tensor(h, {"a"}, {"b"});
    REQUIRE(deparse(t) == "%0[a;b]");
    REQUIRE(deparse(t, &table) == "A[a;b]");
    auto construction =
        ex<BraidingConstruction>(b, SpaceExpr{h, 0}, SpaceExpr{h, 1, true});
    REQUIRE(deparse(construction, &table) ==
            "#braid1 = braiding(space(A, 0), space(A, 1)')");
  }

  SECTION("sums") {
    auto A = tensor("A", {"a"}, {"b"});
    auto B = tensor("B", {"a"}, {"b"});
    auto C = tensor("C", {"a"}, {"b"});
    auto s = A - B + C;
    REQUIRE(s->is<Sum>());
    const auto& summands = s->as<Sum>().summands;
    REQUIRE(summands.size() == 3);
    REQUIRE(summands[0].sign == Sign::Plus);
    REQUIRE(summands[1].sign == Sign::Minus);
    REQUIRE(summands[2].sign == Sign::Plus);
  }

  SECTION("classification") {
    auto A = tensor("A", {"a"}, {"b"});
    auto B = tensor("B", {"b"}, {"c"});
    auto alpha = scalar("α");

    REQUIRE(is_scalar(*alpha));
    REQUIRE(is_scalar(*conj(alpha)));
    REQUIRE(is_scalar(*(alpha * scalar(2.0))));
    REQUIRE(!is_scalar(*A));

    REQUIRE(is_tensor_expr(*A));
    REQUIRE(is_tensor_expr(*(A * B)));
    REQUIRE(is_tensor_expr(*(A + A)));
    REQUIRE(!is_tensor_expr(*alpha));
    REQUIRE(!is_tensor_expr(*define(A, A)));

    REQUIRE(is_general_tensor(*A));
    REQUIRE(is_general_tensor(*(alpha * A)));
    REQUIRE(is_general_tensor(*conj(A * alpha)));
    REQUIRE(!is_general_tensor(*(A * B)));
    REQUIRE(!is_general_tensor(*(A + A)));
  }

  SECTION("general tensors") {
    auto gt = decompose_general_tensor(
        conj(scalar(2.0) * tensor("A", {"a"}, {"b", "c"})));
    REQUIRE(gt.term.adjoint);
    REQUIRE(gt.term.left == IndexList{"b", "c"});
    REQUIRE(gt.term.right == IndexList{"a"});
    REQUIRE(gt.scalars.size() == 1);
    REQUIRE(gt.scalars[0]->is<Conjugate>());

    REQUIRE(has_trace_indices(TensorTerm{"A", false, {"a", "b"}, {"b"}}));
    REQUIRE(!has_trace_indices(TensorTerm{"A", false, {"a", "b"}, {"c"}}));
  }

  SECTION("indices") {
    auto e = tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"});
    REQUIRE(free_indices(e) == IndexList{"a", "c"});
    const auto counts = index_counts(e);
    REQUIRE(counts.at(Index("a")) == 1);
    REQUIRE(counts.at(Index("b")) == 2);

    auto renamed = replace_indices(e, [](const Index& i) {
      return i == Index("b") ? Index("x") : i;
    });
    REQUIRE(deparse(renamed) == "A[a;x] * B[x;c]");

    auto ts = tensors(block({define(tensor("D", {"a"}, {"c"}), e)}));
    REQUIRE(ts.size() == 3);
    REQUIRE(ts[0].object == ObjectRef("D"));
    REQUIRE(ts[2].object == ObjectRef("B"));
  }

  SECTION("traversal") {
    auto e = tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"});
    auto s = annotated("keep", e);
    REQUIRE(tensors(s).empty());
    REQUIRE(map_children(s, [](const NodePtr&) { return scalar(1.0); }) == s);

    auto swapped = map_children(e, [](const NodePtr& child) {
      return child->as<TensorTerm>().left == IndexList{"a"}
                 ? tensor("X", {"a"}, {"b"})
                 : child;
    });
    REQUIRE(deparse(swapped) == "X[a;b] * B[b;c]");
  }
}

TEST_CASE("object_table", "[elements]") {
  using namespace tnplanar;

  ObjectTable table("t");
  auto a = table.bind("A", ObjectRole::Existing);
  auto d = table.bind("D", ObjectRole::Defined);
  REQUIRE(table.bind("A", ObjectRole::Defined) == a);
  REQUIRE(table[a].role == ObjectRole::Existing);
  REQUIRE(table.find("D") == d);
  REQUIRE(!table.find("E"));

  auto t1 = table.make_temporary();
  auto t2 = table.make_temporary();
  auto b1 = table.make_braiding();
  REQUIRE(table[t1].label == "#t1");
  REQUIRE(table[t2].label == "#t2");
  REQUIRE(table[b1].label == "#braid1");
  REQUIRE(table.size() == 5);
  REQUIRE(table.handles(ObjectRole::Temporary).size() == 2);
  REQUIRE(table.handles(ObjectRole::Braiding).front() == b1);
  REQUIRE(table.label(ObjectRef(d)) == "D");
  REQUIRE(table.label(ObjectRef("X")) == "X");
  REQUIRE(to_string(ObjectRole::Braiding) == "braiding");
}
