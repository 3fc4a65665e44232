#ifndef TNPLANAR_PLANAR_NORMALIZE_HPP
#define TNPLANAR_PLANAR_NORMALIZE_HPP

#include <TNPlanar/core/expr.hpp>

namespace tnplanar {

/// @brief rewrites conjugated tensor references as adjoint references

/// Every `conj(A[l;r])` is replaced by `A'[r;l]` (and `conj(A'[l;r])` by
/// `A[r;l]`, so nested conjugates cancel); conjugates of anything else are
/// kept, with their argument normalized. Annotated blocks are returned as-is.
/// @note idempotent
NodePtr normalize_adjoint(const NodePtr& node);

}  // namespace tnplanar

#endif  // TNPLANAR_PLANAR_NORMALIZE_HPP
