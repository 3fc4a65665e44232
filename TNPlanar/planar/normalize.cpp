#include <TNPlanar/planar/normalize.hpp>

#include <TNPlanar/core/deparse.hpp>
#include <TNPlanar/core/expr_algorithms.hpp>
#include <TNPlanar/core/logger.hpp>

#include <utility>

namespace tnplanar {

namespace {

NodePtr normalize_impl(const NodePtr& node) {
  if (node->is<Conjugate>()) {
    auto arg = normalize_impl(node->as<Conjugate>().arg);
    if (arg->is<TensorTerm>())
      return ex<TensorTerm>(arg->as<TensorTerm>().adjointed());
    return conj(std::move(arg));
  }
  return map_children(node, normalize_impl);
}

}  // namespace

NodePtr normalize_adjoint(const NodePtr& node) {
  auto result = normalize_impl(node);
  auto& l = Logger::instance();
  if (l.normalize)
    write_log(l, "normalize_adjoint: ", deparse(node), "\n  -> ",
              deparse(result), "\n");
  return result;
}

}  // namespace tnplanar
