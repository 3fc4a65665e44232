#ifndef TNPLANAR_LOGGER_HPP
#define TNPLANAR_LOGGER_HPP

#include <TNPlanar/core/utility/singleton.hpp>

#include <iostream>

namespace tnplanar {

/// controls logging within TNPlanar components, only useful for
/// troubleshooting/learning
struct Logger : public Singleton<Logger> {
  bool normalize = false;
  bool bind = false;
  bool braiding = false;
  bool planarity = false;
  bool decompose = false;
  bool execute = false;

  /// the stream for logging; can be set to nullptr to silence all output
  std::ostream* stream = &std::clog;

 private:
  friend class Singleton<Logger>;
  Logger(int log_level = 0) {
    if (log_level > 0) {
      normalize = true;
      bind = true;
      braiding = true;
      planarity = true;
      decompose = true;
    }
    if (log_level > 1) {
      execute = true;
    }
  }
};

template <typename... Args>
void write_log(Logger& l, Args const&... args) noexcept {
  if (l.stream) {
    ((*l.stream << args), ...);
    (*l.stream).flush();
  }
}

}  // namespace tnplanar

#endif  // TNPLANAR_LOGGER_HPP
