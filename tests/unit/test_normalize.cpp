#include <catch2/catch_test_macros.hpp>

#include "catch2_tnplanar.hpp"

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr.hpp>
#include <TNPlanar/planar/normalize.hpp>

TEST_CASE("normalize_adjoint", "[planar]") {
  using namespace tnplanar;

  auto A = tensor("A", {"a"}, {"b", "c"});
  auto B = tensor("B", {"b", "c"}, {"d"});

  SECTION("conjugated terms") {
    REQUIRE(deparse(normalize_adjoint(conj(A))) == "A'[b,c;a]");
    REQUIRE(deparse(normalize_adjoint(conj(adjoint("A", {"b", "c"}, {"a"})))) ==
            "A[a;b,c]");
    REQUIRE(deparse(normalize_adjoint(conj(conj(A)))) == "A[a;b,c]");
  }

  SECTION("nested") {
    auto e = define(tensor("D", {"a"}, {"d"}),
                    scalar("α") * conj(A) * B + conj(B));
    REQUIRE(deparse(normalize_adjoint(e)) ==
            "D[a;d] := α * A'[b,c;a] * B[b,c;d] + B'[d;b,c]");
  }

  SECTION("compound conjugates are kept") {
    REQUIRE(deparse(normalize_adjoint(conj(A * B))) ==
            "conj(A[a;b,c] * B[b,c;d])");
    REQUIRE(deparse(normalize_adjoint(conj(conj(A) * B))) ==
            "conj(A'[b,c;a] * B[b,c;d])");
    REQUIRE(deparse(normalize_adjoint(conj(scalar("α")))) == "conj(α)");
  }

  SECTION("annotated blocks are left alone") {
    auto e = annotated("keep", define(tensor("D", {"a"}, {"b", "c"}), conj(A)));
    REQUIRE(normalize_adjoint(e) == e);
  }

  SECTION("idempotent") {
    for (const auto& e :
         {conj(A), conj(conj(A)), conj(conj(conj(A * B))),
          block({define(tensor("D", {"b", "c"}, {"a"}), conj(A)),
                 opaque("for k in 1:2", assign(tensor("E", {"a"}, {"d"}),
                                                A * conj(conj(B))))})}) {
      auto once = normalize_adjoint(e);
      REQUIRE(deparse(normalize_adjoint(once)) == deparse(once));
    }
  }
}
