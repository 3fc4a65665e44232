#include <catch2/catch_test_macros.hpp>

#include "catch2_tnplanar.hpp"

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>
#include <TNPlanar/core/utility/exception.hpp>
#include <TNPlanar/planar/bind.hpp>

#include <string>

TEST_CASE("bind_objects", "[planar]") {
  using namespace tnplanar;

  SECTION("roles and handles") {
    auto e = block(
        {define(tensor("C", {"a"}, {"c"}),
                tensor("A", {"a"}, {"b"}) * tensor("B", {"b"}, {"c"})),
         assign(tensor("E", {"a"}, {"c"}),
                tensor("C", {"a"}, {"c"}) + adjoint("F", {"a"}, {"c"}))});
    ObjectTable table;
    auto result = bind_objects(e, table);

    // inputs first, then outputs of =, then definitions
    REQUIRE(table.size() == 5);
    REQUIRE(result.objects.size() == 5);
    REQUIRE(table[ObjectHandle{0}].label == "A");
    REQUIRE(table[ObjectHandle{1}].label == "B");
    REQUIRE(table[ObjectHandle{2}].label == "C");
    REQUIRE(table[ObjectHandle{3}].label == "F");
    REQUIRE(table[ObjectHandle{4}].label == "E");
    REQUIRE(table[ObjectHandle{2}].role == ObjectRole::Defined);
    REQUIRE(table[ObjectHandle{4}].role == ObjectRole::Existing);
    REQUIRE(table[ObjectHandle{4}].assigned);
    REQUIRE(!table[ObjectHandle{0}].assigned);

    for (const auto& t : tensors(result.expr)) REQUIRE(t.object.is_handle());
    REQUIRE(deparse(result.expr, &table) == deparse(e));

    // defined objects are not checked; F is checked in its own frame
    REQUIRE(result.checks.size() == 4);
    REQUIRE(result.checks[0].label == "A");
    REQUIRE(result.checks[1].label == "B");
    REQUIRE(result.checks[2].label == "E");
    REQUIRE(result.checks[3].label == "F");
    REQUIRE(result.checks[3].expected_out == 1);
    REQUIRE(result.checks[3].expected_in == 1);
  }

  SECTION("adjoint references share the object") {
    auto e = define(tensor("D", {"a"}, {"a2"}),
                    tensor("A", {"a"}, {"b", "c"}) *
                        adjoint("A", {"b", "c"}, {"a2"}));
    ObjectTable table;
    auto result = bind_objects(e, table);
    REQUIRE(table.size() == 2);
    REQUIRE(result.checks.size() == 1);
    REQUIRE(result.checks[0].expected_out == 1);
    REQUIRE(result.checks[0].expected_in == 2);
  }

  SECTION("one check per distinct usage") {
    auto e = define(tensor("D", {"a"}, {"d"}),
                    tensor("A", {"a"}, {"b"}) * tensor("A", {"b"}, {"c"}) *
                        tensor("A", {"c", "d"}));
    ObjectTable table;
    auto result = bind_objects(e, table);
    REQUIRE(result.checks.size() == 2);
    REQUIRE(result.checks[0].expected_out == 1);
    REQUIRE(result.checks[1].expected_out == 2);
    REQUIRE(result.checks[1].expected_in == 0);
  }

  SECTION("braiding placeholders and annotated blocks are not bound") {
    auto e = block(
        {define(tensor("C", {"a", "b"}, {"c", "d"}),
                tensor("τ", {"a", "b"}, {"e", "f"}) *
                    tensor("B", {"e", "f"}, {"c", "d"})),
         annotated("keep", define(tensor("X", {"a"}), tensor("Y", {"a"})))});
    ObjectTable table;
    auto result = bind_objects(e, table);
    REQUIRE(table.size() == 2);
    REQUIRE(!table.find("τ"));
    REQUIRE(!table.find("X"));
    REQUIRE(!table.find("Y"));
    REQUIRE(tensors(result.expr)[1].object == ObjectRef("τ"));
  }

  SECTION("the braiding label is configurable") {
    auto e = define(tensor("C", {"a"}, {"b"}), tensor("τ", {"a"}, {"b"}));
    ObjectTable table;
    bind_objects(e, table, Context({.braiding_label = "β"}));
    REQUIRE(table.find("τ"));
  }

  SECTION("reserved name") {
    auto e = define(tensor("τ", {"a", "b"}, {"c", "d"}),
                    tensor("A", {"a", "b"}, {"c", "d"}));
    ObjectTable table;
    REQUIRE_THROWS_AS(bind_objects(e, table), ReservedNameError);
  }
}

TEST_CASE("arity_check", "[planar]") {
  using namespace tnplanar;

  ArityCheck check{.object = ObjectHandle{0},
                   .expected_out = 1,
                   .expected_in = 2,
                   .label = "A"};
  REQUIRE_NOTHROW(check.run(1, 2));
  REQUIRE_THROWS_AS(check.run(2, 1), ArityError);
  try {
    check.run(2, 1);
  } catch (const ArityError& ex) {
    REQUIRE(ex.expression() == "A");
    REQUIRE(std::string(ex.what()) ==
            "incorrect number of input-output indices: (1, 2) instead of "
            "(2, 1): A");
  }
}
