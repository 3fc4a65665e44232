#ifndef TNPLANAR_CORE_UTILITY_MACROS_H
#define TNPLANAR_CORE_UTILITY_MACROS_H

#include <TNPlanar/core/utility/exception.hpp>

#include <source_location>
#include <string>

/* detect C++ compiler id (ids taken from CMake) */
#if defined(__clang__)
#define TNPLANAR_CXX_COMPILER_IS_CLANG 1
#endif
#if defined(__GNUG__) && !defined(TNPLANAR_CXX_COMPILER_IS_CLANG)
#define TNPLANAR_CXX_COMPILER_IS_GCC 1
#endif

#define TNPLANAR_CONCAT_IMPL(x, y) x##y
/* "concats" a and b without a space in between */
#define TNPLANAR_CONCAT(x, y) TNPLANAR_CONCAT_IMPL(x, y)
#define TNPLANAR_STRINGIFY(x) #x

/* Defines the default error checking behavior; the build system sets
   TNPLANAR_ASSERT_BEHAVIOR_ to one of THROW, ABORT, IGNORE */
#define TNPLANAR_ASSERT_THROW 2
#define TNPLANAR_ASSERT_ABORT 3
#define TNPLANAR_ASSERT_IGNORE 4
#ifndef TNPLANAR_ASSERT_BEHAVIOR_
#define TNPLANAR_ASSERT_BEHAVIOR_ THROW
#endif
#define TNPLANAR_ASSERT_BEHAVIOR \
  TNPLANAR_CONCAT(TNPLANAR_ASSERT_, TNPLANAR_ASSERT_BEHAVIOR_)
#if TNPLANAR_ASSERT_BEHAVIOR != TNPLANAR_ASSERT_IGNORE
#define TNPLANAR_ASSERT_ENABLED
#endif

namespace tnplanar {

/// @return true if TNPLANAR_ASSERT checks its argument
bool assert_enabled();

#ifdef TNPLANAR_ASSERT_ENABLED
[[noreturn]]
#endif
void assert_failed(
    const std::string &errmsg,
    const std::source_location location = std::source_location::current());

}  // namespace tnplanar

#ifdef TNPLANAR_ASSERT_ENABLED
#define TNPLANAR_ASSERT_MESSAGE(EXPR, ...)                          \
  "TNPLANAR_ASSERT(" TNPLANAR_STRINGIFY(EXPR) ") failed" __VA_OPT__( \
      " with message '" __VA_ARGS__ "'")

#define TNPLANAR_ASSERT(EXPR, ...)                                         \
  do {                                                                     \
    if (!(EXPR)) {                                                         \
      tnplanar::assert_failed(TNPLANAR_ASSERT_MESSAGE(EXPR, __VA_ARGS__)); \
    }                                                                      \
  } while (0)
#else
#define TNPLANAR_ASSERT(...) \
  do {                       \
  } while (0)
#endif

#if defined(__cpp_lib_unreachable)
#define TNPLANAR_UNREACHABLE_TOKEN std::unreachable()
#elif defined(TNPLANAR_CXX_COMPILER_IS_GCC) || \
    defined(TNPLANAR_CXX_COMPILER_IS_CLANG)
#define TNPLANAR_UNREACHABLE_TOKEN __builtin_unreachable()
#else
#define TNPLANAR_UNREACHABLE_TOKEN std::abort()
#endif

#define TNPLANAR_UNREACHABLE                              \
  do {                                                    \
    TNPLANAR_ASSERT(false && "reached unreachable code"); \
    TNPLANAR_UNREACHABLE_TOKEN;                           \
  } while (0)

#endif  // TNPLANAR_CORE_UTILITY_MACROS_H
