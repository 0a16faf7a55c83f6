#pragma once

/**
 * Deflation Helpers
 *
 * Single Gram-Schmidt step shared by every selection strategy: once a
 * column has been chosen, its direction is projected out of all columns of
 * the working matrix so later scores only see residual information.
 */

#include "curdecomp/types.hpp"

namespace curdecomp {
namespace helpers {

/**
 * Deflate M in place along column j.
 *
 * v = M[:,j] / ||M[:,j]||, then M[:,i] -= v * (v^T M[:,i]) for every column i
 * (column j itself becomes zero).
 *
 * @throws NumericalSingularityError if column j has zero or non-finite norm
 * @throws InvalidArgumentError if j is out of range
 */
void deflate_column(Matrix& M, Index j);

} // namespace helpers
} // namespace curdecomp
