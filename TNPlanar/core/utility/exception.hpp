#ifndef TNPLANAR_CORE_UTILITY_EXCEPTION_HPP
#define TNPLANAR_CORE_UTILITY_EXCEPTION_HPP

#include <exception>
#include <string>
#include <utility>

namespace tnplanar {

/// basic TNPlanar exception
/// @sa TNPLANAR_ASSERT
class Exception : public std::exception {
 public:
  Exception(const std::string& str) : msg_(str) {}
  virtual const char* what() const noexcept { return msg_.data(); }

 private:
  std::string msg_;
};  // class Exception

/// a diagram could not be compiled; carries the textual form of the
/// offending (sub)expression
class CompilationError : public Exception {
 public:
  CompilationError(const std::string& msg, std::string expression)
      : Exception(expression.empty() ? msg : msg + ": " + expression),
        expression_(std::move(expression)) {}

  /// @return the textual form of the expression that caused the error
  const std::string& expression() const noexcept { return expression_; }

 private:
  std::string expression_;
};

/// the number of indices attached to an object disagrees with its number of
/// output/input legs
class ArityError : public CompilationError {
 public:
  using CompilationError::CompilationError;
};

/// the reserved braiding label was used as a target or with the wrong
/// number of legs
class ReservedNameError : public CompilationError {
 public:
  using CompilationError::CompilationError;
};

/// the spaces of some braiding legs cannot be derived from the expression
class UnresolvedBraidingError : public CompilationError {
 public:
  using CompilationError::CompilationError;
};

/// the expression admits no index order compatible with its target
class PlanarityError : public CompilationError {
 public:
  using CompilationError::CompilationError;
};

/// removing a braiding would change the value of the expression
class UnsafeBraidingRemovalError : public CompilationError {
 public:
  using CompilationError::CompilationError;
};

/// the node is neither a scalar, a general tensor, a product nor a sum
class UnrecognizedExpressionError : public CompilationError {
 public:
  using CompilationError::CompilationError;
};

/// a plan could not be executed against a backend
class ExecutionError : public Exception {
 public:
  using Exception::Exception;
};

}  // namespace tnplanar

#endif  // TNPLANAR_CORE_UTILITY_EXCEPTION_HPP
