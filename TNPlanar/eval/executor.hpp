#ifndef TNPLANAR_EVAL_EXECUTOR_HPP
#define TNPLANAR_EVAL_EXECUTOR_HPP

#include <TNPlanar/eval/backend.hpp>
#include <TNPlanar/planar/compile.hpp>

#include <optional>
#include <string>

namespace tnplanar {

/// named tensor objects, the inputs and outputs of a Plan
using Environment = container::map<std::string, TensorObjectPtr>;

///
/// \brief Runs a Plan against a Backend.
///
/// Existing objects are taken from the environment, the arity checks are
/// run, then the statements are evaluated in order. In strict mode every
/// binary contraction, trace and permutation must preserve the cyclic
/// order of the legs, i.e. the plan must be planar.
///
class Executor {
 public:
  explicit Executor(const Backend& backend) : backend_(backend) {}

  /// \param strict if set, overrides the default, which is strict for plans
  ///        compiled in BraidingMode::Construct
  Executor& set_strict(std::optional<bool> strict) {
    strict_ = strict;
    return *this;
  }

  ///
  /// \return \p env with the defined and assigned objects of \p plan
  ///         updated, and named scalar results added as rank-0 objects
  /// \throw ArityError if an arity check fails
  /// \throw ExecutionError if an existing object is missing from \p env,
  ///        the plan contains an opaque block, or the backend fails
  ///
  Environment run(const Plan& plan, Environment env) const;

 private:
  const Backend& backend_;
  std::optional<bool> strict_;
};

}  // namespace tnplanar

#endif  // TNPLANAR_EVAL_EXECUTOR_HPP
