#ifndef TNPLANAR_EVAL_BACKEND_HPP
#define TNPLANAR_EVAL_BACKEND_HPP

#include <TNPlanar/core/container.hpp>
#include <TNPlanar/core/expr.hpp>
#include <TNPlanar/core/space.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace tnplanar {

///
/// \brief A tensor object as seen by the plan executor: a map from the
///        tensor product of its domain spaces to the tensor product of its
///        codomain spaces.
///
/// Legs are numbered codomain first, then domain.
///
class TensorObject {
 public:
  virtual ~TensorObject() noexcept = default;

  /// \return the number of outgoing (codomain) legs
  [[nodiscard]] virtual std::size_t numout() const = 0;

  /// \return the number of incoming (domain) legs
  [[nodiscard]] virtual std::size_t numin() const = 0;

  ///
  /// \return the outward space of leg \p pos, i.e. the codomain space, or
  ///         the dual of the domain space.
  ///
  [[nodiscard]] virtual Space space(std::size_t pos) const = 0;

  [[nodiscard]] virtual std::string to_string() const = 0;

  [[nodiscard]] std::size_t rank() const { return numout() + numin(); }
};

using TensorObjectPtr = std::shared_ptr<const TensorObject>;

/// \return true if \p a and \p b have the same codomain and domain
inline bool same_spaces(const TensorObject& a, const TensorObject& b) {
  if (a.numout() != b.numout() || a.numin() != b.numin()) return false;
  for (std::size_t k = 0; k != a.rank(); ++k)
    if (a.space(k) != b.space(k)) return false;
  return true;
}

/// a leg of the result of a contraction: leg @c position of operand
/// @c operand (0 or 1)
struct LegSource {
  std::size_t operand = 0;
  std::size_t position = 0;

  friend bool operator==(const LegSource&, const LegSource&) = default;
};

///
/// \brief Specifies a binary contraction.
///
struct ContractionSpec {
  /// pairs of contracted legs (position in the first operand, position in
  /// the second operand)
  container::svector<std::pair<std::size_t, std::size_t>> contracted;
  /// the legs of the result, codomain first
  container::svector<LegSource> output;
  /// the number of codomain legs of the result
  std::size_t numout = 0;
};

///
/// \brief Specifies a permutation of legs, possibly with self-contractions.
///
struct PermutationSpec {
  /// pairs of legs traced out
  container::svector<std::pair<std::size_t, std::size_t>> traces;
  /// the legs of the result, codomain first
  container::svector<std::size_t> output;
  /// the number of codomain legs of the result
  std::size_t numout = 0;
};

///
/// \brief The operations the plan executor needs from a tensor algebra.
///
class Backend {
 public:
  virtual ~Backend() noexcept = default;

  ///
  /// \return the braiding V1 ⊗ V2 → V2 ⊗ V1
  ///
  [[nodiscard]] virtual TensorObjectPtr braiding(const Space& v1,
                                                 const Space& v2) const = 0;

  ///
  /// \return the adjoint of \p a, with codomain and domain exchanged
  ///
  [[nodiscard]] virtual TensorObjectPtr adjoint(const TensorObject& a) const = 0;

  ///
  /// \brief Contracts \p a with \p b.
  /// \throw ExecutionError if contracted legs have incompatible spaces
  ///
  [[nodiscard]] virtual TensorObjectPtr contract(
      const TensorObject& a, const TensorObject& b,
      const ContractionSpec& spec) const = 0;

  ///
  /// \brief Permutes (and traces) the legs of \p a.
  /// \throw ExecutionError if traced legs have incompatible spaces
  ///
  [[nodiscard]] virtual TensorObjectPtr permute(
      const TensorObject& a, const PermutationSpec& spec) const = 0;

  ///
  /// \return `a + b` or `a - b`
  /// \throw ExecutionError if \p a and \p b have different spaces
  ///
  [[nodiscard]] virtual TensorObjectPtr add(const TensorObject& a,
                                            const TensorObject& b,
                                            Sign sign) const = 0;

  ///
  /// \return \p a multiplied by the scalar expression \p factor
  ///
  [[nodiscard]] virtual TensorObjectPtr scale(const TensorObject& a,
                                              const Node& factor) const = 0;
};

}  // namespace tnplanar

#endif  // TNPLANAR_EVAL_BACKEND_HPP
