#include <catch2/catch_test_macros.hpp>

#include "catch2_tnplanar.hpp"

#include <TNPlanar/core/utility/macros.hpp>

#include <string>

TEST_CASE("macros", "[elements]") {
  SECTION("TNPLANAR_ASSERT") {
#if TNPLANAR_ASSERT_BEHAVIOR == TNPLANAR_ASSERT_THROW
    REQUIRE(tnplanar::assert_enabled());
    REQUIRE_THROWS_AS(tnplanar::assert_failed("test"), tnplanar::Exception);
    try {
      // clang-format off
#line 1000  // to make sure the line number of the next line is fixed
tnplanar::assert_failed("test");
      // clang-format on
    } catch (tnplanar::Exception& ex) {
      // see #line up there
      // N.B. clang <16 has std::source_location produce wrong line numbers when
      // initialized as default argument see
      // https://github.com/llvm/llvm-project/issues/56379
#if !defined(TNPLANAR_CXX_COMPILER_IS_CLANG) || __clang_major__ >= 16
      REQUIRE(std::string(ex.what()).find("test_macros.cpp:1000 in function ") !=
              std::string::npos);
#endif
    }
    REQUIRE_THROWS_AS(
        [] { TNPLANAR_ASSERT(1 == 0, "testing TNPLANAR_ASSERT"); }(),
        tnplanar::Exception);
#endif
  }
}
