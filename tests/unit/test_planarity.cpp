#include <catch2/catch_test_macros.hpp>

#include "catch2_tnplanar.hpp"

#include <TNPlanar/core/expr.hpp>
#include <TNPlanar/core/utility/exception.hpp>
#include <TNPlanar/planar/planarity.hpp>

TEST_CASE("check_planarity", "[planar]") {
  using namespace tnplanar;

  auto triangle = tensor("A", {"a", 1, 2}) * tensor("B", {"b", 2, 3}) *
                  tensor("C", {"c", 3, 1});

  SECTION("planar") {
    auto e = define(tensor("D", {"a", "c", "b"}), triangle);
    REQUIRE(check_planarity(e) == e);

    // rotations of the target are planar too
    REQUIRE_NOTHROW(check_planarity(define(tensor("D", {"c"}, {"a", "b"}),
                                           triangle)));
    REQUIRE_NOTHROW(check_planarity(
        define(tensor("E", {"a"}, {"c"}),
               tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"}))));
  }

  SECTION("target order does not match") {
    auto e = define(tensor("D", {"a", "b", "c"}), triangle);
    REQUIRE_THROWS_AS(check_planarity(e), PlanarityError);
    try {
      check_planarity(e);
    } catch (const PlanarityError& ex) {
      REQUIRE(ex.expression() ==
              "D[a,b,c;] := A[a,1,2;] * B[b,2,3;] * C[c,3,1;]");
    }
  }

  SECTION("no planar order") {
    auto e = define(tensor("D", {}), tensor("A", {"a", "b"}, {"b", "a"}));
    REQUIRE_THROWS_AS(check_planarity(e), PlanarityError);
    try {
      check_planarity(e);
    } catch (const PlanarityError& ex) {
      REQUIRE(ex.expression() == "A[a,b;b,a]");
    }
  }

  SECTION("statements are checked independently") {
    auto e = block({define(tensor("D", {"a", "c", "b"}), triangle),
                    opaque("for k in 1:2",
                           assign(tensor("D", {"a", "b", "c"}), triangle))});
    REQUIRE_THROWS_AS(check_planarity(e), PlanarityError);
  }

  SECTION("skipped statements") {
    auto bad = define(tensor("D", {"a", "b", "c"}), triangle);
    REQUIRE_NOTHROW(check_planarity(annotated("keep", bad)));
    REQUIRE_NOTHROW(
        check_planarity(define(scalar("s"), scalar("α") * scalar(2.0))));
  }
}
