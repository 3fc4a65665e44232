#include <catch2/catch_test_macros.hpp>

#include "catch2_tnplanar.hpp"

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>
#include <TNPlanar/core/utility/exception.hpp>
#include <TNPlanar/planar/decompose.hpp>
#include <TNPlanar/planar/ordering.hpp>

#include <string>

namespace {

std::string decomposed(const tnplanar::NodePtr& e,
                       tnplanar::ObjectTable& table) {
  return tnplanar::deparse(tnplanar::decompose_contractions(e, table), &table);
}

}  // namespace

TEST_CASE("decompose_contractions", "[planar]") {
  using namespace tnplanar;

  ObjectTable table;

  SECTION("raw products need no temporaries") {
    auto e = define(tensor("E", {"a", "b"}),
                    tensor("A", {"a", "c"}) * tensor("B", {"c", "b"}));
    REQUIRE(decomposed(e, table) == "E[a,b;] := A[a,c;] * B[c,b;]");
    REQUIRE(table.empty());

    // operands are reordered to produce the declared order
    e = define(tensor("E", {"a", "b"}),
               tensor("B", {"c", "b"}) * tensor("A", {"a", "c"}));
    REQUIRE(decomposed(e, table) == "E[a,b;] := A[a,c;] * B[c,b;]");
    e = define(tensor("E", {"b", "a"}),
               tensor("A", {"a", "c"}) * tensor("B", {"c", "b"}));
    REQUIRE(decomposed(e, table) == "E[b,a;] := B[c,b;] * A[a,c;]");
    REQUIRE(table.empty());
  }

  SECTION("chains") {
    auto e = define(tensor("E", {"a"}, {"d"}),
                    tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"}) *
                        tensor("C", {"c"}, {"d"}));
    REQUIRE(decomposed(e, table) ==
            "#tmp1[a;c] := A[a;b] * B[b;c]\n"
            "E[a;d] := #tmp1[a;c] * C[c;d]");
    REQUIRE(table.handles(ObjectRole::Temporary).size() == 1);
  }

  SECTION("temporaries preserve the cyclic order") {
    auto rhs = tensor("A", {"a", "x"}, {"d"}) * tensor("B", {"x", "b"}, {"c"});
    auto e = define(tensor("E", {"a", "b"}, {"d", "c"}), rhs);
    REQUIRE(decomposed(e, table) ==
            "#tmp1[d,a;c,b] := A[a,x;d] * B[x,b;c]\n"
            "E[a,b;d,c] := #tmp1[d,a;c,b]");

    container::vector<NodePtr> pre;
    ObjectTable table2;
    auto lowered = extract_contraction_pairs(
        rhs, {.left = {"a", "b"}, .right = {"d", "c"}}, pre, table2);
    REQUIRE(pre.size() == 1);
    const auto& tmp = lowered->as<TensorTerm>();
    REQUIRE(is_cyclic_permutation(tmp.natural_order(),
                                  IndexList{"a", "b", "c", "d"}));
    // index conservation
    REQUIRE(free_indices(pre[0]->as<Assignment>().rhs) ==
            IndexList{"a", "d", "b", "c"});
  }

  SECTION("traces are materialized") {
    auto e = define(tensor("E", {"a"}, {"c"}),
                    tensor("A", {"a", "x"}, {"b", "x"}) *
                        tensor("B", {"b"}, {"c"}));
    REQUIRE(decomposed(e, table) ==
            "#tmp1[a;b] := A[a,x;b,x]\n"
            "E[a;c] := #tmp1[a;b] * B[b;c]");

    // a trace assigned to a declared target is left to the executor
    e = define(tensor("E", {"a"}, {"b"}), tensor("A", {"a", "x"}, {"b", "x"}));
    REQUIRE(decomposed(e, table) == "E[a;b] := A[a,x;b,x]");
  }

  SECTION("scalars") {
    auto e = define(tensor("E", {"a"}, {"b"}),
                    scalar("α") * tensor("A", {"a"}, {"b"}));
    REQUIRE(decomposed(e, table) == "E[a;b] := α * A[a;b]");

    e = define(tensor("E", {"a"}, {"c"}),
               scalar("α") *
                   (tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"})));
    REQUIRE(decomposed(e, table) ==
            "#tmp1[a;c] := A[a;b] * B[b;c]\n"
            "E[a;c] := α * #tmp1[a;c]");

    auto s = define(scalar("s"), scalar("α") * scalar(2.0));
    REQUIRE(decompose_contractions(s, table) == s);
  }

  SECTION("sums") {
    auto e = define(tensor("S", {"a"}, {"c"}),
                    tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"}) -
                        tensor("C", {"a"}, {"c"}));
    REQUIRE(decomposed(e, table) == "S[a;c] := A[a;b] * B[b;c] - C[a;c]");
    REQUIRE(table.empty());

    e = define(tensor("F", {"a"}, {"c"}),
               (tensor("A", {"a"}, {"b"}) + tensor("B", {"a"}, {"b"})) *
                   tensor("C", {"b"}, {"c"}));
    REQUIRE(decomposed(e, table) ==
            "#tmp1[a;b] := A[a;b] + B[a;b]\n"
            "F[a;c] := #tmp1[a;b] * C[b;c]");
  }

  SECTION("nested statements") {
    auto e = opaque(
        "for k in 1:2",
        block({assign(tensor("E", {"a"}, {"d"}),
                      tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"}) *
                          tensor("C", {"c"}, {"d"}))}));
    REQUIRE(decomposed(e, table) ==
            "for k in 1:2 {\n"
            "  #tmp1[a;c] := A[a;b] * B[b;c]\n"
            "  E[a;d] = #tmp1[a;c] * C[c;d]\n"
            "}");

    auto kept = annotated(
        "keep", define(tensor("E", {"a"}, {"d"}),
                       tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"}) *
                           tensor("C", {"c"}, {"d"})));
    REQUIRE(decompose_contractions(kept, table) == kept);
  }

  SECTION("non-planar products") {
    auto e = define(tensor("D", {"a", "b", "c"}),
                    tensor("A", {"a", 1, 2}) * tensor("B", {"b", 2, 3}) *
                        tensor("C", {"c", 3, 1}));
    REQUIRE_THROWS_AS(decompose_contractions(e, table), PlanarityError);
  }

  SECTION("unrecognized expressions") {
    container::vector<NodePtr> pre;
    auto rhs = conj(tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"}));
    REQUIRE_THROWS_AS(
        extract_contraction_pairs(rhs, {.left = {"a"}, .right = {"c"}}, pre,
                                  table),
        UnrecognizedExpressionError);
  }
}
