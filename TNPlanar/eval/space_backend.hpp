#ifndef TNPLANAR_EVAL_SPACE_BACKEND_HPP
#define TNPLANAR_EVAL_SPACE_BACKEND_HPP

#include <TNPlanar/eval/backend.hpp>

namespace tnplanar {

using SpaceList = container::svector<Space, 4>;

///
/// \brief A tensor that carries only its spaces.
///
class SpaceTensor final : public TensorObject {
 public:
  SpaceTensor(SpaceList codomain, SpaceList domain)
      : codomain_(std::move(codomain)), domain_(std::move(domain)) {}

  /// \return a SpaceTensor with the spaces of \p t
  static SpaceTensor from(const TensorObject& t);

  [[nodiscard]] std::size_t numout() const override {
    return codomain_.size();
  }
  [[nodiscard]] std::size_t numin() const override { return domain_.size(); }

  /// \throw ExecutionError if \p pos is out of range
  [[nodiscard]] Space space(std::size_t pos) const override;

  /// \return e.g. `V ⊗ W ← X'`
  [[nodiscard]] std::string to_string() const override;

  const SpaceList& codomain() const { return codomain_; }
  const SpaceList& domain() const { return domain_; }

  friend bool operator==(const SpaceTensor& a, const SpaceTensor& b) {
    return a.codomain_ == b.codomain_ && a.domain_ == b.domain_;
  }

 private:
  SpaceList codomain_;
  SpaceList domain_;
};

///
/// \brief A Backend that tracks the spaces of tensors without storing any
///        data.
///
/// Contractions verify that contracted legs carry dual spaces and predict
/// the spaces of the result.
///
class SpaceBackend final : public Backend {
 public:
  [[nodiscard]] TensorObjectPtr braiding(const Space& v1,
                                         const Space& v2) const override;

  [[nodiscard]] TensorObjectPtr adjoint(const TensorObject& a) const override;

  [[nodiscard]] TensorObjectPtr contract(
      const TensorObject& a, const TensorObject& b,
      const ContractionSpec& spec) const override;

  [[nodiscard]] TensorObjectPtr permute(
      const TensorObject& a, const PermutationSpec& spec) const override;

  [[nodiscard]] TensorObjectPtr add(const TensorObject& a,
                                    const TensorObject& b,
                                    Sign sign) const override;

  [[nodiscard]] TensorObjectPtr scale(const TensorObject& a,
                                      const Node& factor) const override;
};

}  // namespace tnplanar

#endif  // TNPLANAR_EVAL_SPACE_BACKEND_HPP
