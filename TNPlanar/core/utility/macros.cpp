#include <TNPlanar/core/utility/macros.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace tnplanar {

bool assert_enabled() {
#ifdef TNPLANAR_ASSERT_ENABLED
  return true;
#else
  return false;
#endif
}

#ifdef TNPLANAR_ASSERT_ENABLED
void assert_failed(const std::string &errmsg,
                   const std::source_location location) {
#if TNPLANAR_ASSERT_BEHAVIOR == TNPLANAR_ASSERT_THROW
  std::ostringstream oss;
  oss << errmsg << " at " << location.file_name() << ":" << location.line()
      << " in function '" << location.function_name() << "'";
  throw tnplanar::Exception(oss.str());
#elif TNPLANAR_ASSERT_BEHAVIOR == TNPLANAR_ASSERT_ABORT
  std::cerr << errmsg << " at " << location.file_name() << ":"
            << location.line() << " in function '" << location.function_name()
            << "'" << std::endl;
  std::abort();
#endif
}
#else
void assert_failed(const std::string &, const std::source_location) {}
#endif

}  // namespace tnplanar
