#include <TNPlanar/eval/space_backend.hpp>

#include <TNPlanar/core/logger.hpp>
#include <TNPlanar/core/utility/exception.hpp>

namespace tnplanar {

namespace {

std::string leg_string(const TensorObject& t, std::size_t pos) {
  return "leg " + std::to_string(pos) + " of (" + t.to_string() + ")";
}

/// \throw ExecutionError unless legs \p pa of \p a and \p pb of \p b can be
///        contracted
void check_contractible(const TensorObject& a, std::size_t pa,
                        const TensorObject& b, std::size_t pb) {
  if (pa >= a.rank() || pb >= b.rank())
    throw ExecutionError("contracted leg out of range");
  if (a.space(pa) != b.space(pb).dual())
    throw ExecutionError("space mismatch: cannot contract " +
                         leg_string(a, pa) + " with " + leg_string(b, pb));
}

/// \return the tensor whose leg k has outward space \p outward[k]
TensorObjectPtr make_tensor(const SpaceList& outward, std::size_t numout) {
  SpaceList codomain, domain;
  for (std::size_t k = 0; k != outward.size(); ++k) {
    if (k < numout)
      codomain.push_back(outward[k]);
    else
      domain.push_back(outward[k].dual());
  }
  return std::make_shared<SpaceTensor>(std::move(codomain), std::move(domain));
}

}  // namespace

SpaceTensor SpaceTensor::from(const TensorObject& t) {
  SpaceList codomain, domain;
  for (std::size_t k = 0; k != t.numout(); ++k) codomain.push_back(t.space(k));
  for (std::size_t k = 0; k != t.numin(); ++k)
    domain.push_back(t.space(t.numout() + k).dual());
  return SpaceTensor(std::move(codomain), std::move(domain));
}

Space SpaceTensor::space(std::size_t pos) const {
  if (pos < codomain_.size()) return codomain_[pos];
  if (pos < codomain_.size() + domain_.size())
    return domain_[pos - codomain_.size()].dual();
  throw ExecutionError("leg " + std::to_string(pos) +
                       " out of range for tensor " + to_string());
}

std::string SpaceTensor::to_string() const {
  auto product = [](const SpaceList& spaces) {
    if (spaces.empty()) return std::string("one");
    std::string result;
    for (const auto& s : spaces) {
      if (!result.empty()) result += " ⊗ ";
      result += s.to_string();
    }
    return result;
  };
  return product(codomain_) + " ← " + product(domain_);
}

TensorObjectPtr SpaceBackend::braiding(const Space& v1, const Space& v2) const {
  return std::make_shared<SpaceTensor>(SpaceList{v2, v1}, SpaceList{v1, v2});
}

TensorObjectPtr SpaceBackend::adjoint(const TensorObject& a) const {
  const auto t = SpaceTensor::from(a);
  return std::make_shared<SpaceTensor>(t.domain(), t.codomain());
}

TensorObjectPtr SpaceBackend::contract(const TensorObject& a,
                                       const TensorObject& b,
                                       const ContractionSpec& spec) const {
  for (const auto& [pa, pb] : spec.contracted)
    check_contractible(a, pa, b, pb);
  if (spec.output.size() + 2 * spec.contracted.size() != a.rank() + b.rank())
    throw ExecutionError("contraction does not use every leg exactly once");

  SpaceList outward;
  for (const auto& leg : spec.output)
    outward.push_back(leg.operand == 0 ? a.space(leg.position)
                                       : b.space(leg.position));
  auto result = make_tensor(outward, spec.numout);

  auto& l = Logger::instance();
  if (l.execute)
    write_log(l, "SpaceBackend::contract: (", a.to_string(), ") * (",
              b.to_string(), ") -> ", result->to_string(), "\n");
  return result;
}

TensorObjectPtr SpaceBackend::permute(const TensorObject& a,
                                      const PermutationSpec& spec) const {
  for (const auto& [p, q] : spec.traces) check_contractible(a, p, a, q);
  if (spec.output.size() + 2 * spec.traces.size() != a.rank())
    throw ExecutionError("permutation does not use every leg exactly once");

  SpaceList outward;
  for (auto pos : spec.output) outward.push_back(a.space(pos));
  return make_tensor(outward, spec.numout);
}

TensorObjectPtr SpaceBackend::add(const TensorObject& a, const TensorObject& b,
                                  Sign) const {
  if (!same_spaces(a, b))
    throw ExecutionError("space mismatch: cannot add (" + a.to_string() +
                         ") and (" + b.to_string() + ")");
  return std::make_shared<SpaceTensor>(SpaceTensor::from(a));
}

TensorObjectPtr SpaceBackend::scale(const TensorObject& a, const Node&) const {
  return std::make_shared<SpaceTensor>(SpaceTensor::from(a));
}

}  // namespace tnplanar
