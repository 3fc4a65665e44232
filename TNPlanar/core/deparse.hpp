#ifndef TNPLANAR_DEPARSE_HPP
#define TNPLANAR_DEPARSE_HPP

#include <TNPlanar/core/expr.hpp>

#include <string>

namespace tnplanar {

/// @brief produces the textual form of an expression

/// Tensor terms print as `A[a,b;c]`, adjoint terms as `A'[c;a,b]`,
/// products as `x * y`, definitions as `lhs := rhs`; statements of a block
/// are separated by newlines.
/// @param node the expression
/// @param objects if nonnull, used to print the labels of bound objects;
/// otherwise a handle `h` prints as `%h`
std::string deparse(const NodePtr& node, const ObjectTable* objects = nullptr);

std::string deparse(const TensorTerm& term,
                    const ObjectTable* objects = nullptr);

std::string deparse(const SpaceExpr& space,
                    const ObjectTable* objects = nullptr);

}  // namespace tnplanar

#endif  // TNPLANAR_DEPARSE_HPP
