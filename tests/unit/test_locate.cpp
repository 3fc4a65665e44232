#include <catch2/catch_test_macros.hpp>

#include "catch2_tnplanar.hpp"

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr.hpp>
#include <TNPlanar/core/utility/exception.hpp>
#include <TNPlanar/planar/locate.hpp>

TEST_CASE("locate", "[planar]") {
  using namespace tnplanar;

  const ObjectHandle A{0}, B{1};
  container::vector<TensorTerm> terms{
      TensorTerm{A, false, {"a", "b"}, {"c"}},
      TensorTerm{B, true, {"c", "d"}, {"e"}}};

  SECTION("non-adjoint term") {
    auto loc = locate("b", terms);
    REQUIRE(loc);
    REQUIRE(loc->object == ObjectRef(A));
    REQUIRE(!loc->adjoint);
    REQUIRE(loc->position == 1);
    REQUIRE(loc->object_position == 1);
    REQUIRE(loc->space() == SpaceExpr{A, 1, false});

    loc = locate("c", terms);
    REQUIRE(loc->object == ObjectRef(A));
    REQUIRE(loc->position == 2);
    REQUIRE(loc->object_position == 2);
  }

  SECTION("adjoint term") {
    // B'[c,d;e] refers to B[e;c,d]
    auto loc = locate("d", terms);
    REQUIRE(loc);
    REQUIRE(loc->object == ObjectRef(B));
    REQUIRE(loc->adjoint);
    REQUIRE(loc->position == 1);
    REQUIRE(loc->object_position == 2);
    REQUIRE(loc->space() == SpaceExpr{B, 2, true});

    loc = locate("e", terms);
    REQUIRE(loc->position == 2);
    REQUIRE(loc->object_position == 0);
  }

  SECTION("missing index") { REQUIRE(!locate("z", terms)); }

  SECTION("is_braiding") {
    REQUIRE(is_braiding(TensorTerm{"τ", false, {"a", "b"}, {"c", "d"}}));
    REQUIRE(!is_braiding(TensorTerm{A, false, {"a", "b"}, {"c", "d"}}));
    REQUIRE(is_braiding(TensorTerm{"β", false, {"a"}, {"b"}},
                        Context({.braiding_label = "β"})));
  }
}

TEST_CASE("purge_braidings", "[planar]") {
  using namespace tnplanar;

  auto B = tensor("B", {"b", "a"}, {"c", "d"});

  SECTION("trivial placeholders are removed") {
    auto e = define(tensor("C", {"a", "b"}, {"c", "d"}),
                    tensor("τ", {"a", "b"}, {"b", "a"}) * B);
    REQUIRE(deparse(purge_braidings(e)) == "C[a,b;c,d] := B[b,a;c,d]");

    auto conjugated = tensor("X", {"x"}) * conj(tensor("τ", {"p", "q"},
                                                        {"q", "p"})) *
                      tensor("Y", {"x"});
    REQUIRE(deparse(purge_braidings(conjugated)) == "X[x;] * Y[x;]");
  }

  SECTION("products without placeholders are kept") {
    auto e = tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"});
    REQUIRE(deparse(purge_braidings(e)) == deparse(e));
  }

  SECTION("a product of placeholders collapses to one") {
    auto e = tensor("τ", {"a", "b"}, {"b", "a"}) *
             tensor("τ", {"c", "d"}, {"d", "c"});
    auto result = purge_braidings(e);
    REQUIRE(result->is<ScalarTerm>());
    REQUIRE(deparse(result) == "1");
  }

  SECTION("non-trivial placeholders") {
    auto e = tensor("τ", {"a", "b"}, {"e", "f"}) *
             tensor("B", {"e", "f"}, {"c", "d"});
    REQUIRE_THROWS_AS(purge_braidings(e), UnsafeBraidingRemovalError);
  }

  SECTION("placeholders outside products") {
    auto e = define(tensor("C", {"a", "b"}, {"b", "a"}),
                    tensor("τ", {"a", "b"}, {"b", "a"}));
    REQUIRE_THROWS_AS(purge_braidings(e), UnsafeBraidingRemovalError);
  }

  SECTION("placeholders with the wrong number of legs") {
    auto e = tensor("τ", {"a"}, {"a"}) * B;
    REQUIRE_THROWS_AS(purge_braidings(e), ReservedNameError);
  }
}
